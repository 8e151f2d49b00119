#pragma once
#include "kernel/command_runner.hpp"
#include "kernel/process_supervisor.hpp"
#include <chrono>
#include <string>
#include <vector>

// GNU screen backend: one detached named session, one screen window per
// service. Each window drops into an interactive bash once its command exits.
class ScreenSupervisor : public ProcessSupervisor {
public:
  ScreenSupervisor(CommandRunner &runner, std::string state_dir, std::string screen_bin = "screen");

  std::string backend() const override;
  bool has_session(const std::string &name) override;
  SessionHandle create_session(const std::string &name, const WindowCommand &first) override;
  WindowHandle add_window(SessionHandle &session, const WindowCommand &cmd) override;
  int attach(const std::string &name) override;
  KillResult kill(const std::string &name) override;
  std::vector<std::string> operator_commands(const std::string &name) const override;

  // Session names listed by `screen -ls` output, without the pid prefix.
  static std::vector<std::string> parse_session_list(const std::string &output);

  // How long kill() waits for the session to leave `screen -ls` after quit.
  void set_quit_timeout(std::chrono::milliseconds timeout);

private:
  WindowHandle make_window(const std::string &session, uint32_t index, const WindowCommand &cmd) const;

  CommandRunner &runner_;
  std::string screen_bin_;
  std::chrono::milliseconds quit_timeout_{2000};
};
