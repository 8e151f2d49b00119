#pragma once
#include "environment/environment.hpp"
#include "environment/network_env.hpp"
#include "kernel/process_supervisor.hpp"
#include "services/service_spec.hpp"

// Turns a ServiceSpec into a window of the session: resolved inside the
// provisioned environment, run from the service's own working directory,
// with the network parameters exported.
class ProcessLauncher {
public:
  ProcessLauncher(ProcessSupervisor &supervisor, ProvisionedEnvironment env, NetworkEnv net);

  // First service: creates the session with it as window 0.
  // Throws LaunchFailure (nothing spawned) or SessionCreationError.
  SessionHandle open(const std::string &session_name, const ServiceSpec &spec);

  // Any later service: next window of `session`. Throws LaunchFailure.
  WindowHandle launch(SessionHandle &session, const ServiceSpec &spec);

  // Throws LaunchFailure when the executable or working directory is missing.
  WindowCommand build_command(const ServiceSpec &spec) const;

private:
  ProcessSupervisor &supervisor_;
  ProvisionedEnvironment env_;
  NetworkEnv net_;
};
