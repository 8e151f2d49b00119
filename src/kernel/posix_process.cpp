#include "kernel/posix_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace fs = std::filesystem;

// Copy of the current environment with `overrides` applied, as KEY=VALUE
// strings. Built before fork so the child only calls async-signal-safe code.
static std::vector<std::string> build_environment(const EnvOverrides &overrides) {
  std::map<std::string, std::string> merged;
  for (char **e = environ; e && *e; ++e) {
    std::string entry(*e);
    size_t eq = entry.find('=');
    if (eq == std::string::npos) continue;
    merged[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  for (const auto &[k, v] : overrides) merged[k] = v;

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto &[k, v] : merged) out.push_back(k + "=" + v);
  return out;
}

static std::vector<char *> to_cstrings(std::vector<std::string> &strings) {
  std::vector<char *> out;
  out.reserve(strings.size() + 1);
  for (auto &s : strings) out.push_back(const_cast<char *>(s.c_str()));
  out.push_back(nullptr);
  return out;
}

static int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 1;
}

CommandResult run_command(const std::vector<std::string> &argv, const RunOptions &opts) {
  CommandResult result;
  if (argv.empty()) {
    result.exit_code = 127;
    result.output = "empty command";
    return result;
  }

  std::vector<std::string> args = argv;
  std::vector<std::string> env = build_environment(opts.env);
  std::vector<char *> c_args = to_cstrings(args);
  std::vector<char *> c_env = to_cstrings(env);

  int out_pipe[2] = {-1, -1};
  if (opts.capture_output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
    result.exit_code = 127;
    result.output = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    if (opts.capture_output) { ::close(out_pipe[0]); ::close(out_pipe[1]); }
    result.exit_code = 127;
    result.output = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    if (opts.capture_output) {
      ::dup2(out_pipe[1], STDOUT_FILENO);
      ::dup2(out_pipe[1], STDERR_FILENO);
    }
    if (!opts.workdir.empty() && ::chdir(opts.workdir.c_str()) != 0) _exit(127);
    ::execvpe(c_args[0], c_args.data(), c_env.data());
    _exit(127);
  }

  if (opts.capture_output) {
    ::close(out_pipe[1]);
    char buf[4096];
    ssize_t n = 0;
    while ((n = ::read(out_pipe[0], buf, sizeof(buf))) != 0) {
      if (n < 0) {
        if (errno == EINTR) continue;
        break;
      }
      result.output.append(buf, static_cast<size_t>(n));
    }
    ::close(out_pipe[0]);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.exit_code = 127;
      result.output += std::string("\nwaitpid failed: ") + std::strerror(errno);
      return result;
    }
  }
  result.exit_code = decode_status(status);
  return result;
}

bool spawn_process(const SpawnRequest &request, pid_t &out_pid, std::string &err) {
  if (request.argv.empty()) {
    err = "empty command";
    return false;
  }

  std::vector<std::string> args = request.argv;
  std::vector<std::string> env = build_environment(request.env);
  std::vector<char *> c_args = to_cstrings(args);
  std::vector<char *> c_env = to_cstrings(env);

  int log_fd = -1;
  if (!request.log_path.empty()) {
    log_fd = ::open(request.log_path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
      err = "cannot open log " + request.log_path + ": " + std::strerror(errno);
      return false;
    }
  }

  // The child reports a failed chdir/exec through this pipe; a successful
  // exec closes it (O_CLOEXEC) and the parent reads EOF.
  int err_pipe[2];
  if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
    err = std::string("pipe failed: ") + std::strerror(errno);
    if (log_fd >= 0) ::close(log_fd);
    return false;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    err = std::string("fork failed: ") + std::strerror(errno);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    if (log_fd >= 0) ::close(log_fd);
    return false;
  }

  if (pid == 0) {
    ::close(err_pipe[0]);
    if (request.new_process_group) ::setpgid(0, 0);

    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    int out_fd = log_fd >= 0 ? log_fd : devnull;
    if (out_fd >= 0) {
      ::dup2(out_fd, STDOUT_FILENO);
      ::dup2(out_fd, STDERR_FILENO);
    }

    if (!request.workdir.empty() && ::chdir(request.workdir.c_str()) != 0) {
      int code = errno;
      (void)!::write(err_pipe[1], &code, sizeof(code));
      _exit(127);
    }
    ::execvpe(c_args[0], c_args.data(), c_env.data());
    int code = errno;
    (void)!::write(err_pipe[1], &code, sizeof(code));
    _exit(127);
  }

  ::close(err_pipe[1]);
  if (log_fd >= 0) ::close(log_fd);
  // avoid racing the child's own setpgid
  if (request.new_process_group) ::setpgid(pid, pid);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(err_pipe[0]);

  if (n > 0) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    err = "cannot start " + request.argv[0] + ": " + std::strerror(child_errno);
    return false;
  }

  out_pid = pid;
  return true;
}

bool reap_process(pid_t pid, int &exit_code) {
  int status = 0;
  pid_t r = ::waitpid(pid, &status, WNOHANG);
  if (r == pid) {
    exit_code = decode_status(status);
    return true;
  }
  return false;
}

bool process_group_exists(pid_t pgid) {
  if (pgid <= 0) return false;
  if (::kill(-pgid, 0) == 0) return true;
  return errno == EPERM;
}

bool terminate_process_group(pid_t pgid, std::string &err) {
  if (pgid <= 0) return true;
  if (::kill(-pgid, SIGTERM) == 0) return true;
  if (errno == ESRCH) return true;
  err = "kill(" + std::to_string(-pgid) + ") failed: " + std::strerror(errno);
  return false;
}

static bool is_executable_file(const fs::path &p) {
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) return false;
  return ::access(p.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string &name,
                                           const std::vector<std::string> &search_dirs,
                                           const std::string &workdir) {
  if (name.empty()) return std::nullopt;

  if (name.find('/') != std::string::npos) {
    fs::path p(name);
    if (p.is_relative() && !workdir.empty()) p = fs::path(workdir) / p;
    if (is_executable_file(p)) return p.string();
    return std::nullopt;
  }

  for (const auto &dir : search_dirs) {
    if (dir.empty()) continue;
    fs::path candidate = fs::path(dir) / name;
    if (is_executable_file(candidate)) return candidate.string();
  }
  return std::nullopt;
}

std::vector<std::string> path_dirs_from_env() {
  std::vector<std::string> dirs;
  const char *path = std::getenv("PATH");
  if (!path) return dirs;

  std::stringstream ss(path);
  std::string dir;
  while (std::getline(ss, dir, ':'))
    if (!dir.empty()) dirs.push_back(dir);
  return dirs;
}
