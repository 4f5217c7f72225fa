#pragma once

#include "archon/config/schema.hpp"
#include "archon/http/client.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace archon::cli {

int run_cli(int argc, char **argv);

/// Runs one command with an explicit environment snapshot and transport.
/// `args` excludes the program name. Returns the process exit status.
int run_cli(std::vector<std::string> args, const config::Environment &env,
            std::shared_ptr<http::HttpClient> http, std::ostream &out, std::ostream &err);

} // namespace archon::cli
