#include "kernel/command_runner.hpp"
#include "util.hpp"

CommandResult SystemCommandRunner::run(const std::vector<std::string> &argv, const RunOptions &opts) {
  DEBUG_PRINT(DEBUG_SUPERVISOR, "exec: %s", shell_join(argv).c_str());
  return run_command(argv, opts);
}
