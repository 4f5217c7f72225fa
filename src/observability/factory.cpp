#include "archon/observability/factory.hpp"

#include "archon/common/fs.hpp"
#include "archon/observability/log_observer.hpp"
#include "archon/observability/multi_observer.hpp"

#include <fstream>
#include <sstream>
#include <vector>

namespace archon::observability {

namespace {

using ObserverResult = common::Result<std::unique_ptr<IObserver>>;

ObserverResult make_backend(const std::string &name, const std::filesystem::path &log_file) {
  if (name == "log") {
    return ObserverResult::success(std::make_unique<LogObserver>());
  }
  if (name == "file") {
    auto dir = common::ensure_dir(log_file.parent_path());
    if (!dir.ok()) {
      return ObserverResult::failure(dir.error());
    }
    auto stream = std::make_unique<std::ofstream>(log_file, std::ios::app);
    if (!stream->is_open()) {
      return ObserverResult::failure("cannot open log file " + log_file.string());
    }
    return ObserverResult::success(std::make_unique<LogObserver>(std::move(stream)));
  }
  return ObserverResult::failure("unknown observability backend '" + name + "'");
}

} // namespace

ObserverResult create_observer(const std::string &backend_spec,
                               const std::filesystem::path &log_file) {
  std::vector<std::unique_ptr<IObserver>> sinks;
  std::stringstream stream(common::to_lower(backend_spec));
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (name.empty() || name == "none") {
      continue;
    }
    auto sink = make_backend(name, log_file);
    if (!sink.ok()) {
      return sink;
    }
    sinks.push_back(std::move(sink.value()));
  }

  if (sinks.empty()) {
    return ObserverResult::success(nullptr);
  }
  if (sinks.size() == 1) {
    return ObserverResult::success(std::move(sinks.front()));
  }
  return ObserverResult::success(std::make_unique<MultiObserver>(std::move(sinks)));
}

} // namespace archon::observability
