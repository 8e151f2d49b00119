#pragma once
#include <map>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

// Thin fork/exec layer. Everything above it talks in argv vectors and never
// touches raw pids except through these helpers.

using EnvOverrides = std::map<std::string, std::string>;

struct RunOptions {
  std::string workdir;       // empty: inherit
  EnvOverrides env;          // merged over the current environment
  bool capture_output{true}; // stdout+stderr collected into CommandResult::output
};

struct CommandResult {
  int exit_code{0}; // 127 when the executable could not be started, 128+N when killed by signal N
  std::string output;

  bool ok() const { return exit_code == 0; }
};

// Runs argv to completion.
CommandResult run_command(const std::vector<std::string> &argv, const RunOptions &opts = {});

struct SpawnRequest {
  std::vector<std::string> argv;
  std::string workdir;
  EnvOverrides env;
  std::string log_path;            // stdout+stderr appended here; empty: /dev/null
  bool new_process_group{true};
};

// Starts argv without waiting for it. Returns false with `err` set when the
// fork, the working directory or the exec failed.
bool spawn_process(const SpawnRequest &request, pid_t &out_pid, std::string &err);

// Non-blocking reap of a child we spawned; true once it has exited.
bool reap_process(pid_t pid, int &exit_code);

bool process_group_exists(pid_t pgid);

// SIGTERM to the whole group. A group that is already gone counts as success.
bool terminate_process_group(pid_t pgid, std::string &err);

// PATH-style lookup. Names containing '/' are checked relative to `workdir`.
std::optional<std::string> find_executable(const std::string &name,
                                           const std::vector<std::string> &search_dirs,
                                           const std::string &workdir = std::string());

std::vector<std::string> path_dirs_from_env();
