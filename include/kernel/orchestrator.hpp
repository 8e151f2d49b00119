#pragma once

#include "config.hpp"
#include "util.hpp"
#include "data_structures/buffered_channel.hpp"
#include "environment/environment.hpp"
#include "kernel/command_runner.hpp"
#include "kernel/dependency_gate.hpp"
#include "kernel/process_launcher.hpp"
#include "kernel/process_supervisor.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Idle -> EnvironmentReady -> SessionReset -> Launching(0..n-1) -> Complete.
// Aborted is terminal; a new run needs a new Orchestrator.
enum class OrchestratorState {
  IDLE,
  ENVIRONMENT_READY,
  SESSION_RESET,
  LAUNCHING,
  COMPLETE,
  ABORTED
};

std::string state_name(OrchestratorState s);

enum class LaunchStatus {
  PENDING,      // not reached yet
  LAUNCHED,     // window up, command still running after the settle wait
  EXITED_EARLY, // command already exited when checked
  NOT_READY,    // readiness probe exhausted
  FAILED,       // could not be started
  SKIPPED,      // a dependency failed, was skipped or never became ready
  UNKNOWN       // run aborted before this service was reached
};

std::string launch_status_name(LaunchStatus s);

struct ServiceResult {
  std::string service;
  LaunchStatus status{LaunchStatus::PENDING};
  std::optional<uint32_t> window_index;
  std::optional<int> exit_code;
  std::string detail;
};

struct RunReport {
  OrchestratorState final_state{OrchestratorState::IDLE};
  std::string abort_reason;
  std::string session_name;
  std::vector<ServiceResult> results;
  std::chrono::milliseconds elapsed{0};

  bool all_launched() const;
  // 0 full success, 2 partial success, 1 aborted
  int exit_code() const;
};

struct StateTransition {
  OrchestratorState state;
  int service_index; // only meaningful for LAUNCHING, -1 otherwise
  std::chrono::steady_clock::time_point at;
};

/**
 * Brings the services up in declared order: provision the environment once,
 * reset the named session, then for each service launch it and wait on the
 * dependency gate before moving to the next. Strictly sequential; the only
 * concurrency is the launched processes themselves.
 */
class Orchestrator {
public:
  Orchestrator(const OrchestrationConfig &cfg, CommandRunner &runner,
               ProcessSupervisor &supervisor, DependencyGate &gate);

  Orchestrator(const Orchestrator &) = delete;
  void operator=(const Orchestrator &) = delete;

  RunReport run();

  // Environment step on its own (`setup`). Throws ProvisioningError.
  ProvisionedEnvironment provision();

  OrchestratorState state() const;
  const std::vector<StateTransition> &transitions() const;
  const SessionHandle &session() const;
  std::vector<std::string> get_logs();

private:
  void transition(OrchestratorState s, int service_index = -1);
  void record(LogLevel level, const std::string &msg);
  void check_network_env(const NetworkEnv &net);
  void launch_all(ProcessLauncher &launcher, RunReport &report);
  bool dependency_usable(const ServiceSpec &svc, const RunReport &report, std::string &why) const;
  void update_from_windows(RunReport &report);

  const OrchestrationConfig cfg_;
  CommandRunner &runner_;
  ProcessSupervisor &supervisor_;
  DependencyGate &gate_;

  OrchestratorState state_{OrchestratorState::IDLE};
  std::vector<StateTransition> transitions_;
  SessionHandle session_;
  bool session_open_{false};
  BufferedChannel<std::string> log_queue_{256, true};
};
