#pragma once
#include "../include/errors.hpp"
#include "../include/kernel/command_runner.hpp"
#include "../include/kernel/process_supervisor.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <string>
#include <unistd.h>
#include <vector>

// Records every argv and answers from a script keyed on argv[0] (or the
// first two words, "screen -ls"), falling back to `fallback`.
class FakeCommandRunner : public CommandRunner {
public:
  using CommandRunner::run;

  CommandResult run(const std::vector<std::string> &argv, const RunOptions &opts) override {
    calls.push_back(argv);
    options.push_back(opts);
    if (handler) return handler(argv);

    if (argv.size() >= 2) {
      auto it = scripted.find(argv[0] + " " + argv[1]);
      if (it != scripted.end()) return it->second;
    }
    if (!argv.empty()) {
      auto it = scripted.find(argv[0]);
      if (it != scripted.end()) return it->second;
    }
    return fallback;
  }

  std::vector<std::vector<std::string>> calls;
  std::vector<RunOptions> options;
  std::map<std::string, CommandResult> scripted;
  std::function<CommandResult(const std::vector<std::string> &)> handler;
  CommandResult fallback{0, ""};
};

// In-memory session backend with launch timestamps.
class FakeSupervisor : public ProcessSupervisor {
public:
  explicit FakeSupervisor(std::string state_dir = "/tmp") : ProcessSupervisor(std::move(state_dir)) {}

  std::string backend() const override { return "fake"; }

  bool has_session(const std::string &name) override {
    return sessions.contains(name) || stuck_sessions.contains(name);
  }

  SessionHandle create_session(const std::string &name, const WindowCommand &first) override {
    if (fail_create) throw SessionCreationError("fake backend refused session " + name);
    created.push_back(name);
    SessionHandle s;
    s.name = name;
    s.windows.push_back(record_window(0, first));
    sessions[name] = true;
    return s;
  }

  WindowHandle add_window(SessionHandle &session, const WindowCommand &cmd) override {
    if (refuse_labels.contains(cmd.label)) throw LaunchFailure(cmd.label, "fake backend refused window");
    WindowHandle w = record_window(static_cast<uint32_t>(session.windows.size()), cmd);
    session.windows.push_back(w);
    return w;
  }

  void refresh(SessionHandle &session) override {
    for (auto &w : session.windows) {
      auto it = exit_codes.find(w.label);
      w.is_alive = it == exit_codes.end();
      if (it != exit_codes.end()) w.exit_code = it->second;
    }
  }

  int attach(const std::string &name) override { return has_session(name) ? 0 : 1; }

  KillResult kill(const std::string &name) override {
    kills.push_back(name);
    if (stuck_sessions.contains(name)) return KillResult::KILL_FAILED;
    if (!sessions.contains(name)) return KillResult::NOT_FOUND;
    sessions.erase(name);
    return KillResult::KILLED;
  }

  std::vector<std::string> operator_commands(const std::string &name) const override {
    return {"Attach: fake attach " + name};
  }

  std::map<std::string, bool> sessions;
  std::map<std::string, bool> stuck_sessions;  // kill() keeps failing for these
  std::map<std::string, bool> refuse_labels;   // add_window() throws LaunchFailure
  std::map<std::string, int> exit_codes;       // label -> exit status reported by refresh()
  bool fail_create{false};

  std::vector<std::string> created;
  std::vector<std::string> kills;
  std::vector<WindowCommand> launched;
  std::vector<std::chrono::steady_clock::time_point> launched_at;

private:
  WindowHandle record_window(uint32_t index, const WindowCommand &cmd) {
    launched.push_back(cmd);
    launched_at.push_back(std::chrono::steady_clock::now());
    WindowHandle w;
    w.index = index;
    w.label = cmd.label;
    w.spawned_command = window_script(cmd, "/dev/null", true);
    w.is_alive = true;
    return w;
  }
};

// Scratch directory removed on scope exit.
class TempDir {
public:
  TempDir() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "launcher-test-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char *made = ::mkdtemp(buf.data());
    if (!made) throw std::runtime_error("mkdtemp failed");
    path_ = made;
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  void operator=(const TempDir &) = delete;

  const std::string &path() const { return path_; }
  std::string file(const std::string &name) const { return (std::filesystem::path(path_) / name).string(); }

  std::string write(const std::string &name, const std::string &content) const {
    std::string p = file(name);
    std::filesystem::create_directories(std::filesystem::path(p).parent_path());
    std::ofstream(p) << content;
    return p;
  }

private:
  std::string path_;
};
