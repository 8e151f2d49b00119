#pragma once
#include "kernel/process_supervisor.hpp"
#include <chrono>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

/**
 * Backend without a terminal multiplexer. Every window is a shell in its own
 * process group with output captured to a per-window log; the session
 * manifest on disk lets a later run (or `attach`/`kill`) find it again.
 *
 * A window whose command has exited stays listed with its exit status and
 * log until the session is killed. A shell killed before it could write the
 * exit marker (SIGKILL, OOM) is reported with 128+signal when this process
 * reaped it, or with no exit code when it was started by another run.
 */
class NativeSupervisor : public ProcessSupervisor {
public:
  explicit NativeSupervisor(std::string state_dir, std::string shell = "/bin/sh");

  std::string backend() const override;
  bool has_session(const std::string &name) override;
  SessionHandle create_session(const std::string &name, const WindowCommand &first) override;
  WindowHandle add_window(SessionHandle &session, const WindowCommand &cmd) override;
  void refresh(SessionHandle &session) override;
  int attach(const std::string &name) override;
  KillResult kill(const std::string &name) override;
  std::vector<std::string> operator_commands(const std::string &name) const override;

  // attach() writes here; tests point it at a stringstream
  void set_output(std::ostream &out);
  void set_kill_grace(std::chrono::milliseconds grace);

private:
  WindowHandle spawn_window(const std::string &session, uint32_t index, const WindowCommand &cmd,
                            std::string &err);
  void wait_group_exit(pid_t pgid);

  std::string shell_;
  std::ostream *out_;
  std::map<pid_t, int> reaped_; // wait status of window shells this process reaped
  std::chrono::milliseconds kill_grace_{2000};
};
