#include "kernel/orchestrator.hpp"
#include "environment/network_env.hpp"
#include "errors.hpp"

#include <algorithm>

std::string state_name(OrchestratorState s) {
  switch (s) {
  case OrchestratorState::IDLE:              return "Idle";
  case OrchestratorState::ENVIRONMENT_READY: return "EnvironmentReady";
  case OrchestratorState::SESSION_RESET:     return "SessionReset";
  case OrchestratorState::LAUNCHING:         return "Launching";
  case OrchestratorState::COMPLETE:          return "Complete";
  case OrchestratorState::ABORTED:           return "Aborted";
  }
  return "Unknown";
}

std::string launch_status_name(LaunchStatus s) {
  switch (s) {
  case LaunchStatus::PENDING:      return "pending";
  case LaunchStatus::LAUNCHED:     return "launched";
  case LaunchStatus::EXITED_EARLY: return "exited-early";
  case LaunchStatus::NOT_READY:    return "not-ready";
  case LaunchStatus::FAILED:       return "failed";
  case LaunchStatus::SKIPPED:      return "skipped";
  case LaunchStatus::UNKNOWN:      return "unknown";
  }
  return "unknown";
}

bool RunReport::all_launched() const {
  return std::all_of(results.begin(), results.end(),
                     [](const ServiceResult &r) { return r.status == LaunchStatus::LAUNCHED; });
}

int RunReport::exit_code() const {
  if (final_state != OrchestratorState::COMPLETE) return 1;
  return all_launched() ? 0 : 2;
}

Orchestrator::Orchestrator(const OrchestrationConfig &cfg, CommandRunner &runner,
                           ProcessSupervisor &supervisor, DependencyGate &gate)
    : cfg_(cfg), runner_(runner), supervisor_(supervisor), gate_(gate) {
  transitions_.push_back({OrchestratorState::IDLE, -1, std::chrono::steady_clock::now()});
}

OrchestratorState Orchestrator::state() const { return state_; }

const std::vector<StateTransition> &Orchestrator::transitions() const { return transitions_; }

const SessionHandle &Orchestrator::session() const { return session_; }

std::vector<std::string> Orchestrator::get_logs() { return log_queue_.items(); }

void Orchestrator::transition(OrchestratorState s, int service_index) {
  state_ = s;
  transitions_.push_back({s, service_index, std::chrono::steady_clock::now()});
  DEBUG_PRINT(DEBUG_ORCHESTRATOR, "-> %s (%d)", state_name(s).c_str(), service_index);
}

void Orchestrator::record(LogLevel level, const std::string &msg) {
  log_queue_.send(format_log_line(level, "orchestrator", msg));
  log_line(level, "orchestrator", msg);
}

ProvisionedEnvironment Orchestrator::provision() {
  EnvironmentProvisioner provisioner(runner_, cfg_);
  EnvironmentDescriptor descriptor = EnvironmentDescriptor::from_config(cfg_);
  ProvisionedEnvironment env = provisioner.ensure(descriptor);
  record(LogLevel::INFO, std::string(provisioner.created_last_run() ? "created" : "reused") +
                             " environment " + env.root() + ", dependencies synced from " +
                             descriptor.manifest_path);
  return env;
}

void Orchestrator::check_network_env(const NetworkEnv &net) {
  if (!net.loaded()) {
    record(LogLevel::WARN, "network env " + cfg_.network_env +
                               " not found; services expecting SERVER_HOST/*_PORT will not start");
    return;
  }
  auto missing = missing_keys(net);
  if (!missing.empty())
    record(LogLevel::WARN, "network env " + cfg_.network_env + " lacks " + join(missing, ", "));
}

bool Orchestrator::dependency_usable(const ServiceSpec &svc, const RunReport &report, std::string &why) const {
  if (!svc.depends_on) return true;

  for (const auto &r : report.results) {
    if (r.service != *svc.depends_on) continue;
    if (r.status == LaunchStatus::FAILED || r.status == LaunchStatus::SKIPPED ||
        r.status == LaunchStatus::NOT_READY) {
      why = "dependency " + r.service + " is " + launch_status_name(r.status);
      return false;
    }
    return true;
  }
  why = "dependency " + *svc.depends_on + " was never launched";
  return false;
}

void Orchestrator::launch_all(ProcessLauncher &launcher, RunReport &report) {
  for (size_t i = 0; i < cfg_.services.size(); ++i) {
    const ServiceSpec &svc = cfg_.services[i];
    ServiceResult &result = report.results[i];
    transition(OrchestratorState::LAUNCHING, static_cast<int>(i));

    std::string why;
    if (!dependency_usable(svc, report, why)) {
      result.status = LaunchStatus::SKIPPED;
      result.detail = why;
      record(LogLevel::WARN, "skipping " + svc.name + ": " + why);
      continue;
    }

    WindowHandle window;
    try {
      if (!session_open_) {
        // SessionCreationError propagates and aborts the run
        session_ = launcher.open(cfg_.session_name, svc);
        session_open_ = true;
        window = session_.windows.front();
      } else {
        window = launcher.launch(session_, svc);
      }
    } catch (const LaunchFailure &e) {
      result.status = LaunchStatus::FAILED;
      result.detail = e.what();
      record(LogLevel::ERROR, std::string("launch failed: ") + e.what());
      continue;
    }

    result.status = LaunchStatus::LAUNCHED;
    result.window_index = window.index;
    record(LogLevel::INFO, svc.name + " -> window " + std::to_string(window.index));

    try {
      gate_.wait_for_settle(svc);
    } catch (const DependencyNotReadyError &e) {
      result.status = LaunchStatus::NOT_READY;
      result.detail = e.what();
      record(LogLevel::ERROR, e.what());
      if (cfg_.strict_readiness) throw;
    }

    update_from_windows(report);
    if (result.status == LaunchStatus::EXITED_EARLY)
      record(LogLevel::WARN, svc.name + " exited early" +
                                 (result.exit_code ? " with code " + std::to_string(*result.exit_code) : std::string()));
  }
}

// Folds window liveness into results; a service whose command is gone is
// reported as exited-early whatever the gate said.
void Orchestrator::update_from_windows(RunReport &report) {
  if (!session_open_) return;
  supervisor_.refresh(session_);

  for (auto &r : report.results) {
    if (!r.window_index) continue;
    if (r.status != LaunchStatus::LAUNCHED && r.status != LaunchStatus::NOT_READY) continue;
    for (const auto &w : session_.windows) {
      if (w.index != *r.window_index || w.is_alive) continue;
      r.status = LaunchStatus::EXITED_EARLY;
      r.exit_code = w.exit_code;
    }
  }
}

RunReport Orchestrator::run() {
  if (state_ != OrchestratorState::IDLE)
    throw LauncherError("orchestrator already ran (state " + state_name(state_) + "); start a fresh one");

  const auto started = std::chrono::steady_clock::now();
  RunReport report;
  report.session_name = cfg_.session_name;
  for (const auto &svc : cfg_.services) report.results.push_back(ServiceResult{svc.name});

  try {
    ProvisionedEnvironment env = provision();
    transition(OrchestratorState::ENVIRONMENT_READY);

    NetworkEnv net = load_network_env(cfg_.network_env);
    check_network_env(net);

    KillResult reset = supervisor_.reset_session(cfg_.session_name);
    if (reset == KillResult::KILL_FAILED)
      throw SessionConflictError("previous session '" + cfg_.session_name + "' could not be killed");
    record(LogLevel::INFO, "session reset (" + kill_result_name(reset) + ") via " + supervisor_.backend());
    transition(OrchestratorState::SESSION_RESET);

    ProcessLauncher launcher(supervisor_, env, net);
    launch_all(launcher, report);

    update_from_windows(report);
    transition(OrchestratorState::COMPLETE);
    record(LogLevel::INFO, "all services processed, session " + cfg_.session_name);
  } catch (const LauncherError &e) {
    // ProvisioningError, SessionConflictError, SessionCreationError, strict DependencyNotReadyError
    report.abort_reason = e.what();
    record(LogLevel::ERROR, "aborted: " + report.abort_reason);
    transition(OrchestratorState::ABORTED);
    update_from_windows(report);
    for (auto &r : report.results)
      if (r.status == LaunchStatus::PENDING) r.status = LaunchStatus::UNKNOWN;
  }

  report.final_state = state_;
  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return report;
}
