#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

// Base of every error the launcher raises on purpose. The CLI catches this
// at the top level; anything else is a bug.
class LauncherError : public std::runtime_error {
public:
  explicit LauncherError(const std::string &msg) : std::runtime_error(msg) {}
};

// Bad launcher.conf content or an inconsistent service list.
class ConfigError : public LauncherError {
public:
  explicit ConfigError(const std::string &msg) : LauncherError(msg) {}
};

// Environment creation or dependency sync exited non-zero. Fatal: no service
// may be launched after this.
class ProvisioningError : public LauncherError {
public:
  explicit ProvisioningError(const std::string &msg) : LauncherError(msg) {}
};

// A previous session with the same name is still alive after the kill request.
class SessionConflictError : public LauncherError {
public:
  explicit SessionConflictError(const std::string &msg) : LauncherError(msg) {}
};

class SessionCreationError : public LauncherError {
public:
  explicit SessionCreationError(const std::string &msg) : LauncherError(msg) {}
};

// A service command could not be started (unresolvable executable, backend
// refused the window).
class LaunchFailure : public LauncherError {
public:
  LaunchFailure(const std::string &service, const std::string &msg)
      : LauncherError(service + ": " + msg), service_(service) {}
  const std::string &service() const { return service_; }

private:
  std::string service_;
};

// Readiness probe retries exhausted for a service.
class DependencyNotReadyError : public LauncherError {
public:
  DependencyNotReadyError(const std::string &service, uint32_t attempts)
      : LauncherError(service + " not ready after " + std::to_string(attempts) + " probe attempts"),
        service_(service), attempts_(attempts) {}
  const std::string &service() const { return service_; }
  uint32_t attempts() const { return attempts_; }

private:
  std::string service_;
  uint32_t attempts_;
};
