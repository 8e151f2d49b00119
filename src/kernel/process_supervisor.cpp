#include "kernel/process_supervisor.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

static const char *MANIFEST_FILE = "session.manifest";

std::string kill_result_name(KillResult r) {
  switch (r) {
  case KillResult::KILLED:      return "killed";
  case KillResult::NOT_FOUND:   return "not-found";
  case KillResult::KILL_FAILED: return "kill-failed";
  }
  return "kill-failed";
}

std::optional<int> read_exit_marker(const std::string &path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;
  int code = 0;
  if (!(in >> code)) return std::nullopt; // created but not yet written
  return code;
}

ProcessSupervisor::ProcessSupervisor(std::string state_dir) : state_dir_(std::move(state_dir)) {
  std::error_code ec;
  fs::path abs = fs::absolute(state_dir_, ec);
  if (!ec) state_dir_ = abs.lexically_normal().string();
}

const std::string &ProcessSupervisor::state_dir() const { return state_dir_; }

KillResult ProcessSupervisor::reset_session(const std::string &name) {
  KillResult r = kill(name);
  if (r == KillResult::KILLED && has_session(name)) {
    log_warn("session", "session '" + name + "' still present after kill");
    return KillResult::KILL_FAILED;
  }
  return r;
}

void ProcessSupervisor::refresh(SessionHandle &session) {
  for (auto &w : session.windows) {
    auto code = read_exit_marker(w.exit_marker);
    w.exit_code = code;
    w.is_alive = !code.has_value();
  }
}

std::optional<SessionHandle> ProcessSupervisor::find_session(const std::string &name) {
  if (!has_session(name)) return std::nullopt;
  SessionHandle s;
  s.name = name;
  s.windows = read_manifest(name);
  refresh(s);
  return s;
}

// === Session directory ===

std::string ProcessSupervisor::session_dir(const std::string &name) const {
  if (!is_plain_name(name))
    throw SessionCreationError("invalid session name '" + name + "'");
  return (fs::path(state_dir_) / name).string();
}

std::string ProcessSupervisor::exit_marker_path(const std::string &name, uint32_t index,
                                                const std::string &label) const {
  if (!is_plain_name(label))
    throw LaunchFailure(label, "invalid window label");
  return (fs::path(session_dir(name)) / (std::to_string(index) + "-" + label + ".exit")).string();
}

std::string ProcessSupervisor::log_path(const std::string &name, uint32_t index,
                                        const std::string &label) const {
  if (!is_plain_name(label))
    throw LaunchFailure(label, "invalid window label");
  return (fs::path(session_dir(name)) / (std::to_string(index) + "-" + label + ".log")).string();
}

void ProcessSupervisor::prepare_session_dir(const std::string &name) {
  std::error_code ec;
  fs::remove_all(session_dir(name), ec);
  if (ec)
    throw SessionCreationError("cannot clear " + session_dir(name) + ": " + ec.message());
  fs::create_directories(session_dir(name), ec);
  if (ec)
    throw SessionCreationError("cannot create " + session_dir(name) + ": " + ec.message());
}

bool ProcessSupervisor::remove_session_dir(const std::string &name, std::string &err) {
  std::error_code ec;
  fs::remove_all(session_dir(name), ec);
  if (ec) {
    err = ec.message();
    return false;
  }
  return true;
}

// === Manifest ===
// One tab-separated line per window: index, label, pgid, exit marker, log, command.

void ProcessSupervisor::append_manifest(const std::string &name, const WindowHandle &w) {
  std::ofstream out(fs::path(session_dir(name)) / MANIFEST_FILE, std::ios::app);
  if (!out) {
    log_warn("session", "cannot write manifest for '" + name + "'");
    return;
  }
  out << w.index << '\t' << w.label << '\t' << w.pgid << '\t' << w.exit_marker << '\t'
      << w.log_path << '\t' << w.spawned_command << '\n';
}

std::vector<WindowHandle> ProcessSupervisor::read_manifest(const std::string &name) const {
  std::vector<WindowHandle> windows;
  std::ifstream in(fs::path(session_dir(name)) / MANIFEST_FILE);
  std::string line;

  while (std::getline(in, line)) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    for (int i = 0; i < 5 && std::getline(ss, field, '\t'); ++i) fields.push_back(field);
    std::string command;
    std::getline(ss, command);
    if (fields.size() < 5) continue;

    WindowHandle w;
    try {
      w.index = static_cast<uint32_t>(std::stoul(fields[0]));
      w.pgid = static_cast<pid_t>(std::stol(fields[2]));
    } catch (const std::exception &) {
      continue;
    }
    w.label = fields[1];
    w.exit_marker = fields[3];
    w.log_path = fields[4];
    w.spawned_command = command;
    windows.push_back(w);
  }
  return windows;
}

bool ProcessSupervisor::manifest_exists(const std::string &name) const {
  std::error_code ec;
  return fs::exists(fs::path(session_dir(name)) / MANIFEST_FILE, ec);
}

std::string ProcessSupervisor::window_script(const WindowCommand &cmd, const std::string &exit_marker,
                                             bool export_env) {
  std::ostringstream oss;
  if (export_env) {
    for (const auto &[k, v] : cmd.env) oss << "export " << k << "=" << shell_quote(v) << "; ";
  }
  if (!cmd.activate_script.empty()) oss << ". " << shell_quote(cmd.activate_script) << " && ";
  oss << "cd " << shell_quote(cmd.workdir.empty() ? "." : cmd.workdir) << " && "
      << shell_join(cmd.argv) << "; echo $? > " << shell_quote(exit_marker);
  return oss.str();
}
