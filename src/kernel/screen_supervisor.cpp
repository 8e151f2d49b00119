#include "kernel/screen_supervisor.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>
#include <unistd.h>

ScreenSupervisor::ScreenSupervisor(CommandRunner &runner, std::string state_dir, std::string screen_bin)
    : ProcessSupervisor(std::move(state_dir)), runner_(runner), screen_bin_(std::move(screen_bin)) {}

std::string ScreenSupervisor::backend() const { return "screen"; }

void ScreenSupervisor::set_quit_timeout(std::chrono::milliseconds timeout) { quit_timeout_ = timeout; }

// Lines look like "\t12345.game_system\t(Detached)".
std::vector<std::string> ScreenSupervisor::parse_session_list(const std::string &output) {
  std::vector<std::string> names;
  std::istringstream in(output);
  std::string line;

  while (std::getline(in, line)) {
    auto tokens = split(line);
    if (tokens.empty()) continue;
    const std::string &id = tokens[0];
    size_t dot = id.find('.');
    if (dot == 0 || dot == std::string::npos) continue;
    if (!std::all_of(id.begin(), id.begin() + static_cast<long>(dot), ::isdigit)) continue;
    names.push_back(id.substr(dot + 1));
  }
  return names;
}

bool ScreenSupervisor::has_session(const std::string &name) {
  // screen -ls exits non-zero both when sessions exist and when none do on
  // some versions, so only the listing is trusted.
  CommandResult res = runner_.run({screen_bin_, "-ls", name});
  auto names = parse_session_list(res.output);
  return std::find(names.begin(), names.end(), name) != names.end();
}

WindowHandle ScreenSupervisor::make_window(const std::string &session, uint32_t index,
                                           const WindowCommand &cmd) const {
  WindowHandle w;
  w.index = index;
  w.label = cmd.label;
  w.exit_marker = exit_marker_path(session, index, cmd.label);
  w.spawned_command = window_script(cmd, w.exit_marker, true) + "; exec bash";
  w.is_alive = true;
  return w;
}

SessionHandle ScreenSupervisor::create_session(const std::string &name, const WindowCommand &first) {
  prepare_session_dir(name);

  WindowHandle w = make_window(name, 0, first);
  CommandResult res = runner_.run(
      {screen_bin_, "-dmS", name, "-t", first.label, "bash", "-c", w.spawned_command});
  if (!res.ok())
    throw SessionCreationError("screen -dmS " + name + " failed (exit " + std::to_string(res.exit_code) +
                               "): " + tail_lines(res.output, 3));
  if (!has_session(name))
    throw SessionCreationError("screen session '" + name + "' did not come up");

  append_manifest(name, w);
  DEBUG_PRINT(DEBUG_SUPERVISOR, "session %s window 0 (%s)", name.c_str(), first.label.c_str());

  SessionHandle s;
  s.name = name;
  s.windows.push_back(w);
  return s;
}

WindowHandle ScreenSupervisor::add_window(SessionHandle &session, const WindowCommand &cmd) {
  const uint32_t index = static_cast<uint32_t>(session.windows.size());
  WindowHandle w = make_window(session.name, index, cmd);

  // explicit window number keeps screen's numbering aligned with ours
  CommandResult res = runner_.run({screen_bin_, "-S", session.name, "-X", "screen", "-t", cmd.label,
                                   std::to_string(index), "bash", "-c", w.spawned_command});
  if (!res.ok())
    throw LaunchFailure(cmd.label, "screen -X screen failed (exit " + std::to_string(res.exit_code) +
                                       "): " + tail_lines(res.output, 3));

  append_manifest(session.name, w);
  session.windows.push_back(w);
  return w;
}

int ScreenSupervisor::attach(const std::string &name) {
  if (!has_session(name)) {
    log_error("session", "no screen session named '" + name + "'");
    return 1;
  }
  std::vector<std::string> args = {screen_bin_, "-r", name};
  std::vector<char *> argv;
  for (auto &a : args) argv.push_back(const_cast<char *>(a.c_str()));
  argv.push_back(nullptr);

  // interactive: hand the terminal over to screen
  ::execvp(argv[0], argv.data());
  log_error("session", std::string("cannot exec screen: ") + std::strerror(errno));
  return 1;
}

KillResult ScreenSupervisor::kill(const std::string &name) {
  if (!has_session(name)) return KillResult::NOT_FOUND;

  CommandResult res = runner_.run({screen_bin_, "-S", name, "-X", "quit"});
  if (!res.ok()) {
    log_warn("session", "screen -X quit for '" + name + "' exited " + std::to_string(res.exit_code) +
                            ": " + tail_lines(res.output, 2));
    return KillResult::KILL_FAILED;
  }

  // quit is asynchronous: the socket lingers until screen has torn down
  using namespace std::chrono;
  const auto deadline = steady_clock::now() + quit_timeout_;
  while (has_session(name)) {
    if (steady_clock::now() >= deadline) {
      log_warn("session", "screen session '" + name + "' still listed " +
                              std::to_string(quit_timeout_.count()) + " ms after quit");
      return KillResult::KILL_FAILED;
    }
    std::this_thread::sleep_for(milliseconds(50));
  }

  std::string err;
  if (!remove_session_dir(name, err))
    log_warn("session", "stale state left for '" + name + "': " + err);
  return KillResult::KILLED;
}

std::vector<std::string> ScreenSupervisor::operator_commands(const std::string &name) const {
  return {
      "Attach:       screen -r " + name,
      "Next window:  Ctrl+A then N",
      "Detach:       Ctrl+A then D",
      "Kill:         screen -S " + name + " -X quit",
  };
}
