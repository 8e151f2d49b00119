#pragma once
#include "config.hpp"
#include "kernel/command_runner.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * Where the dependency environment lives. `is_provisioned` is the existence
 * of root_path; it is never torn down by the launcher.
 */
struct EnvironmentDescriptor {
  std::string root_path;
  std::string manifest_path;
  bool is_provisioned{false};

  static EnvironmentDescriptor from_config(const OrchestrationConfig &cfg);
};

/**
 * Activation context of a provisioned environment. Launched services run
 * with its bin dir ahead of the host PATH.
 */
class ProvisionedEnvironment {
public:
  ProvisionedEnvironment() = default;
  ProvisionedEnvironment(std::string root, std::string bin_dir);

  const std::string &root() const;
  const std::string &bin_dir() const;
  std::string activate_script() const;

  EnvOverrides env_overrides() const;    // VIRTUAL_ENV and PATH
  std::vector<std::string> search_dirs() const;

  // Executable as the service's shell would find it after activation.
  std::optional<std::string> resolve(const std::string &executable, const std::string &workdir) const;

private:
  std::string root_;
  std::string bin_dir_;
};

class EnvironmentProvisioner {
public:
  EnvironmentProvisioner(CommandRunner &runner, const OrchestrationConfig &cfg);

  // Creates the root if missing, then always re-applies the manifest.
  // Throws ProvisioningError.
  ProvisionedEnvironment ensure(EnvironmentDescriptor &descriptor);

  bool created_last_run() const;

private:
  void create_root(const EnvironmentDescriptor &descriptor);
  void sync_manifest(const EnvironmentDescriptor &descriptor, const ProvisionedEnvironment &env);

  CommandRunner &runner_;
  std::vector<std::string> create_cmd_;
  std::vector<std::string> sync_cmd_;
  std::string bin_dir_name_;
  bool created_last_run_{false};
};
