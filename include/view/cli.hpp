#pragma once
#include "config.hpp"
#include "kernel/command_runner.hpp"
#include "kernel/dependency_gate.hpp"
#include "kernel/process_supervisor.hpp"
#include "view/reporter.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

class CLI {
public:
  CLI();
  ~CLI();
  int run(int argc, char **argv); // returns exit code

private:
  int handle_command(const std::string &cmd);
  bool parse_args(const std::vector<std::string> &args, std::string &cmd);
  void initialize_system();

  int cmd_up();
  int cmd_setup();
  int cmd_status();
  int cmd_attach();
  int cmd_kill();
  void print_help() const;

  OrchestrationConfig cfg_;
  std::string config_path_{"launcher.conf"};
  std::optional<SupervisorBackend> backend_override_;

  SystemCommandRunner runner_;
  std::unique_ptr<ProcessSupervisor> supervisor_;
  std::unique_ptr<Reporter> reporter_;
};

std::unique_ptr<ProcessSupervisor> make_supervisor(const OrchestrationConfig &cfg, CommandRunner &runner);
DependencyGate make_gate(const OrchestrationConfig &cfg);
