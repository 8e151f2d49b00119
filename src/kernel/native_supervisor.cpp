#include "kernel/native_supervisor.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

NativeSupervisor::NativeSupervisor(std::string state_dir, std::string shell)
    : ProcessSupervisor(std::move(state_dir)), shell_(std::move(shell)), out_(&std::cout) {}

std::string NativeSupervisor::backend() const { return "native"; }

void NativeSupervisor::set_output(std::ostream &out) { out_ = &out; }

void NativeSupervisor::set_kill_grace(std::chrono::milliseconds grace) { kill_grace_ = grace; }

bool NativeSupervisor::has_session(const std::string &name) {
  return manifest_exists(name);
}

WindowHandle NativeSupervisor::spawn_window(const std::string &session, uint32_t index,
                                            const WindowCommand &cmd, std::string &err) {
  WindowHandle w;
  w.index = index;
  w.label = cmd.label;
  w.exit_marker = exit_marker_path(session, index, cmd.label);
  w.log_path = log_path(session, index, cmd.label);

  // activation happens through the environment, not by sourcing a script
  WindowCommand plain = cmd;
  plain.activate_script.clear();
  w.spawned_command = window_script(plain, w.exit_marker, false);

  SpawnRequest req;
  req.argv = {shell_, "-c", w.spawned_command};
  req.env = cmd.env;
  req.log_path = w.log_path;
  req.new_process_group = true;

  pid_t pid = 0;
  if (!spawn_process(req, pid, err)) return w;

  w.pgid = pid;
  w.is_alive = true;
  return w;
}

SessionHandle NativeSupervisor::create_session(const std::string &name, const WindowCommand &first) {
  prepare_session_dir(name);

  std::string err;
  WindowHandle w = spawn_window(name, 0, first, err);
  if (w.pgid == 0) {
    std::string ignored;
    remove_session_dir(name, ignored);
    throw SessionCreationError("cannot start first window '" + first.label + "': " + err);
  }
  append_manifest(name, w);
  DEBUG_PRINT(DEBUG_SUPERVISOR, "session %s window 0 pgid %d", name.c_str(), (int)w.pgid);

  SessionHandle s;
  s.name = name;
  s.windows.push_back(w);
  return s;
}

WindowHandle NativeSupervisor::add_window(SessionHandle &session, const WindowCommand &cmd) {
  const uint32_t index = static_cast<uint32_t>(session.windows.size());

  std::string err;
  WindowHandle w = spawn_window(session.name, index, cmd, err);
  if (w.pgid == 0) throw LaunchFailure(cmd.label, err);

  append_manifest(session.name, w);
  session.windows.push_back(w);
  return w;
}

void NativeSupervisor::refresh(SessionHandle &session) {
  for (auto &w : session.windows) {
    int code = 0;
    // only succeeds for windows this process spawned
    if (w.pgid > 0 && reap_process(w.pgid, code)) reaped_[w.pgid] = code;
  }
  ProcessSupervisor::refresh(session);

  // the marker wins; without one, a vanished group means the shell was killed
  for (auto &w : session.windows) {
    if (!w.is_alive || w.pgid <= 0) continue;
    auto it = reaped_.find(w.pgid);
    if (it != reaped_.end()) {
      w.is_alive = false;
      w.exit_code = it->second;
    } else if (!process_group_exists(w.pgid)) {
      // re-read: the shell may have written the marker just before exiting
      w.exit_code = read_exit_marker(w.exit_marker);
      w.is_alive = false;
    }
  }
}

int NativeSupervisor::attach(const std::string &name) {
  auto session = find_session(name);
  if (!session) {
    log_error("session", "no native session named '" + name + "' under " + state_dir_);
    return 1;
  }

  std::ostream &out = *out_;
  out << "Session " << name << " (" << session->windows.size() << " windows)\n";
  for (const auto &w : session->windows) {
    out << "=== [" << w.index << "] " << w.label << " -- ";
    if (w.is_alive) out << "running (pgid " << w.pgid << ")";
    else if (w.exit_code) out << "exited with " << *w.exit_code;
    else out << "exited (status unknown)";
    out << " ===\n";

    std::ifstream log(w.log_path);
    std::stringstream ss;
    ss << log.rdbuf();
    std::string text = tail_lines(ss.str(), 20);
    out << (text.empty() ? "(no output)\n" : text);
    if (!text.empty() && text.back() != '\n') out << "\n";
  }
  out.flush();
  return 0;
}

void NativeSupervisor::wait_group_exit(pid_t pgid) {
  using namespace std::chrono;
  const auto deadline = steady_clock::now() + kill_grace_;
  int code = 0;

  while (steady_clock::now() < deadline) {
    reap_process(pgid, code);
    if (!process_group_exists(pgid)) return;
    std::this_thread::sleep_for(milliseconds(20));
  }

  log_warn("session", "process group " + std::to_string(pgid) + " ignored SIGTERM, sending SIGKILL");
  ::kill(-pgid, SIGKILL);
  std::this_thread::sleep_for(milliseconds(20));
  reap_process(pgid, code);
}

KillResult NativeSupervisor::kill(const std::string &name) {
  if (!has_session(name)) return KillResult::NOT_FOUND;

  bool failed = false;
  auto windows = read_manifest(name);
  for (const auto &w : windows) {
    std::string err;
    if (!terminate_process_group(w.pgid, err)) {
      log_warn("session", "window " + w.label + ": " + err);
      failed = true;
      continue;
    }
    wait_group_exit(w.pgid);
  }
  if (failed) return KillResult::KILL_FAILED;

  std::string err;
  if (!remove_session_dir(name, err)) {
    log_warn("session", "cannot remove state of '" + name + "': " + err);
    return KillResult::KILL_FAILED;
  }
  return KillResult::KILLED;
}

std::vector<std::string> NativeSupervisor::operator_commands(const std::string &name) const {
  return {
      "Attach:       game_launcher --backend native attach   (prints each window's status and log tail)",
      "Logs:         " + session_dir(name) + "/<index>-<label>.log",
      "Detach:       not needed, attach does not take over the terminal",
      "Kill:         game_launcher --backend native kill",
  };
}
