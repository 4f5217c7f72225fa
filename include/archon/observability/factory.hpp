#pragma once

#include "archon/common/result.hpp"
#include "archon/observability/observer.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace archon::observability {

/// Build an observer from a backend spec: "none", "log" (stderr), "file"
/// (appends to `log_file`), or a comma-separated list of those. "none" and
/// an empty spec yield a null observer. Unknown names are an error.
[[nodiscard]] common::Result<std::unique_ptr<IObserver>>
create_observer(const std::string &backend_spec, const std::filesystem::path &log_file);

} // namespace archon::observability
