#include "kernel/process_launcher.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <filesystem>

namespace fs = std::filesystem;

ProcessLauncher::ProcessLauncher(ProcessSupervisor &supervisor, ProvisionedEnvironment env, NetworkEnv net)
    : supervisor_(supervisor), env_(std::move(env)), net_(std::move(net)) {}

WindowCommand ProcessLauncher::build_command(const ServiceSpec &spec) const {
  if (spec.command.empty() || spec.command.front().empty())
    throw LaunchFailure(spec.name, "no command configured");

  std::error_code ec;
  fs::path workdir = fs::absolute(spec.working_dir.empty() ? "." : spec.working_dir, ec);
  if (ec || !fs::is_directory(workdir, ec))
    throw LaunchFailure(spec.name, "working directory '" + spec.working_dir + "' does not exist");

  const std::string &exe = spec.command.front();
  if (!env_.resolve(exe, workdir.string()))
    throw LaunchFailure(spec.name, "executable '" + exe + "' not found in " +
                                       (env_.bin_dir().empty() ? std::string("PATH") : env_.bin_dir() + " or PATH"));

  WindowCommand cmd;
  cmd.label = spec.name;
  cmd.argv = spec.command;
  cmd.workdir = workdir.lexically_normal().string();

  if (!env_.root().empty() && fs::exists(env_.activate_script(), ec))
    cmd.activate_script = env_.activate_script();

  // network parameters first so the environment activation wins on PATH
  for (const auto &[k, v] : net_.values()) cmd.env[k] = v;
  for (const auto &[k, v] : env_.env_overrides()) cmd.env[k] = v;
  return cmd;
}

SessionHandle ProcessLauncher::open(const std::string &session_name, const ServiceSpec &spec) {
  WindowCommand cmd = build_command(spec);
  SessionHandle session = supervisor_.create_session(session_name, cmd);
  log_info("launcher", "started " + spec.name + " in window 0 of " + session_name);
  return session;
}

WindowHandle ProcessLauncher::launch(SessionHandle &session, const ServiceSpec &spec) {
  WindowCommand cmd = build_command(spec);
  WindowHandle w = supervisor_.add_window(session, cmd);
  log_info("launcher", "started " + spec.name + " in window " + std::to_string(w.index) + " of " + session.name);
  return w;
}
