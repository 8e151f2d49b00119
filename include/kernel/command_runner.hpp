#pragma once
#include "kernel/posix_process.hpp"
#include <string>
#include <vector>

// Seam for every external tool the launcher drives (venv/pip, screen).
class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual CommandResult run(const std::vector<std::string> &argv, const RunOptions &opts) = 0;

  CommandResult run(const std::vector<std::string> &argv) { return run(argv, RunOptions{}); }
};

class SystemCommandRunner : public CommandRunner {
public:
  using CommandRunner::run;
  CommandResult run(const std::vector<std::string> &argv, const RunOptions &opts) override;
};
