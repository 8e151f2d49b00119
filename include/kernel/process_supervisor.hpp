#pragma once
#include "kernel/posix_process.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

enum class KillResult {
  KILLED,
  NOT_FOUND,
  KILL_FAILED
};

std::string kill_result_name(KillResult r);

// What a window should run. The supervisor wraps it so the window outlives
// the command and records its exit status.
struct WindowCommand {
  std::string label;
  std::vector<std::string> argv;
  std::string workdir{"."};
  std::string activate_script; // sourced before the command when set
  EnvOverrides env;
};

struct WindowHandle {
  uint32_t index{0};
  std::string label;
  std::string spawned_command;  // shell text actually run in the window
  bool is_alive{false};         // command still running
  std::optional<int> exit_code; // set once the command has exited
  std::string exit_marker;
  std::string log_path;         // native backend only
  pid_t pgid{0};                // native backend only
};

struct SessionHandle {
  std::string name;
  std::vector<WindowHandle> windows;
};

/**
 * Named, persistent, multi-window execution session. Backends decide how a
 * window is isolated and kept inspectable; the orchestration logic only sees
 * this interface.
 *
 * Window indices are assigned in call order: create_session() makes window 0,
 * each add_window() the next index.
 */
class ProcessSupervisor {
public:
  explicit ProcessSupervisor(std::string state_dir);
  virtual ~ProcessSupervisor() = default;

  virtual std::string backend() const = 0;
  virtual bool has_session(const std::string &name) = 0;

  // Throws SessionCreationError.
  virtual SessionHandle create_session(const std::string &name, const WindowCommand &first) = 0;
  // Throws LaunchFailure.
  virtual WindowHandle add_window(SessionHandle &session, const WindowCommand &cmd) = 0;

  // Updates is_alive/exit_code from the exit markers.
  virtual void refresh(SessionHandle &session);

  // Session as recorded on disk by a previous run, if it is still live.
  virtual std::optional<SessionHandle> find_session(const std::string &name);

  virtual int attach(const std::string &name) = 0;
  virtual KillResult kill(const std::string &name) = 0;
  virtual std::vector<std::string> operator_commands(const std::string &name) const = 0;

  // Kill-if-exists, then confirm the name is free. NOT_FOUND is not an error.
  KillResult reset_session(const std::string &name);

  const std::string &state_dir() const;

protected:
  std::string session_dir(const std::string &name) const;
  std::string exit_marker_path(const std::string &name, uint32_t index, const std::string &label) const;
  std::string log_path(const std::string &name, uint32_t index, const std::string &label) const;

  // Fresh, empty session directory. Throws SessionCreationError.
  void prepare_session_dir(const std::string &name);
  bool remove_session_dir(const std::string &name, std::string &err);

  void append_manifest(const std::string &name, const WindowHandle &w);
  std::vector<WindowHandle> read_manifest(const std::string &name) const;
  bool manifest_exists(const std::string &name) const;

  // `<exports> . activate && cd dir && cmd; echo $? > marker`
  static std::string window_script(const WindowCommand &cmd, const std::string &exit_marker,
                                   bool export_env);

  std::string state_dir_;
};

std::optional<int> read_exit_marker(const std::string &path);
