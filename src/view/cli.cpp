#include "view/cli.hpp"
#include "environment/network_env.hpp"
#include "errors.hpp"
#include "kernel/native_supervisor.hpp"
#include "kernel/orchestrator.hpp"
#include "kernel/screen_supervisor.hpp"
#include "util.hpp"

#include <iostream>

static void print_banner() {
  std::cout
    << "------------------------------------------------\n"
    << "  Game Store System: Multi-Window Launcher\n"
    << "------------------------------------------------\n";
}

std::unique_ptr<ProcessSupervisor> make_supervisor(const OrchestrationConfig &cfg, CommandRunner &runner) {
  if (cfg.backend == SupervisorBackend::NATIVE)
    return std::make_unique<NativeSupervisor>(cfg.state_dir);
  return std::make_unique<ScreenSupervisor>(runner, cfg.state_dir);
}

DependencyGate make_gate(const OrchestrationConfig &cfg) {
  RetryPolicy policy;
  policy.attempts = cfg.probe_retries;
  policy.initial_backoff = std::chrono::milliseconds(cfg.probe_backoff_ms);
  policy.max_backoff = std::chrono::milliseconds(cfg.probe_backoff_max_ms);

  if (cfg.readiness == ReadinessPolicy::TCP)
    return DependencyGate(std::make_shared<TcpPortProbe>(load_network_env(cfg.network_env)), policy);
  return DependencyGate(nullptr, policy);
}

// CLI class implementation

CLI::CLI() = default;

CLI::~CLI() = default;

void CLI::initialize_system() {
  cfg_ = load_config(config_path_);
  if (backend_override_) cfg_.backend = *backend_override_;

  supervisor_ = make_supervisor(cfg_, runner_);
  reporter_ = std::make_unique<Reporter>(*supervisor_);
}

bool CLI::parse_args(const std::vector<std::string> &args, std::string &cmd) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &a = args[i];
    if (a == "--config" || a == "-c") {
      if (i + 1 >= args.size()) { std::cerr << "Usage: --config <path>\n"; return false; }
      config_path_ = args[++i];
    }
    else if (a == "--backend" || a == "-b") {
      if (i + 1 >= args.size()) { std::cerr << "Usage: --backend <screen|native>\n"; return false; }
      backend_override_ = parse_backend(args[++i]);
    }
    else if (a == "-h" || a == "--help") {
      cmd = "help";
    }
    else if (!a.empty() && a[0] == '-') {
      std::cerr << "Unknown option: " << a << "\n";
      return false;
    }
    else if (cmd.empty()) {
      cmd = to_lower(a);
    }
    else {
      std::cerr << "Unexpected argument: " << a << "\n";
      return false;
    }
  }
  if (cmd.empty()) cmd = "up";
  return true;
}

int CLI::cmd_up() {
  print_banner();

  DependencyGate gate = make_gate(cfg_);
  Orchestrator orchestrator(cfg_, runner_, *supervisor_, gate);
  RunReport report = orchestrator.run();

  std::cout << reporter_->build_summary(report);
  if (report.final_state == OrchestratorState::COMPLETE)
    std::cout << reporter_->operator_help(report.session_name);

  if (!cfg_.log_file.empty() && !reporter_->write_log(cfg_.log_file, report, orchestrator.get_logs()))
    log_warn("cli", "cannot write " + cfg_.log_file);

  return report.exit_code();
}

int CLI::cmd_setup() {
  print_banner();

  DependencyGate gate = make_gate(cfg_);
  Orchestrator orchestrator(cfg_, runner_, *supervisor_, gate);
  orchestrator.provision();

  std::cout << "------------------------------------------------\n"
            << "SUCCESS: Finish Virtual Environment Setup.\n"
            << "------------------------------------------------\n";
  return 0;
}

int CLI::cmd_status() {
  std::cout << reporter_->build_status(cfg_.session_name, supervisor_->find_session(cfg_.session_name));
  return supervisor_->has_session(cfg_.session_name) ? 0 : 1;
}

int CLI::cmd_attach() {
  return supervisor_->attach(cfg_.session_name);
}

int CLI::cmd_kill() {
  KillResult r = supervisor_->kill(cfg_.session_name);
  std::cout << "Session " << cfg_.session_name << ": " << kill_result_name(r) << "\n";
  return r == KillResult::KILL_FAILED ? 1 : 0;
}

void CLI::print_help() const {
  std::cout << "Usage: game_launcher [--config <path>] [--backend screen|native] [command]\n"
            << "up: provisions the environment and starts every service (default).\n"
            << "setup: provisions the environment only.\n"
            << "status: shows the session and each window's state.\n"
            << "attach: attaches to the session.\n"
            << "kill: kills the session and everything running in it.\n";
}

int CLI::handle_command(const std::string &cmd) {
  if (cmd == "help") { print_help(); return 0; }

  initialize_system();

  if (cmd == "up") return cmd_up();
  if (cmd == "setup") return cmd_setup();
  if (cmd == "status") return cmd_status();
  if (cmd == "attach") return cmd_attach();
  if (cmd == "kill") return cmd_kill();

  std::cerr << "Unknown command: " << cmd << "\n";
  print_help();
  return 64;
}

int CLI::run(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  try {
    std::string cmd;
    if (!parse_args(args, cmd)) return 64;
    return handle_command(cmd);
  } catch (const LauncherError &e) {
    log_error("cli", e.what());
    return 1;
  }
}
