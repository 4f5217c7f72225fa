#include "archon/cli/commands.hpp"

int main(int argc, char **argv) { return archon::cli::run_cli(argc, argv); }
