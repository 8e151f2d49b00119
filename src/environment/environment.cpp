#include "environment/environment.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

static std::string absolute_path(const std::string &p) {
  std::error_code ec;
  fs::path abs = fs::absolute(p, ec);
  if (ec) return p;
  return abs.lexically_normal().string();
}

EnvironmentDescriptor EnvironmentDescriptor::from_config(const OrchestrationConfig &cfg) {
  EnvironmentDescriptor d;
  d.root_path = cfg.env_root;
  d.manifest_path = cfg.env_manifest;
  std::error_code ec;
  d.is_provisioned = fs::exists(d.root_path, ec);
  return d;
}

// === ProvisionedEnvironment ===

ProvisionedEnvironment::ProvisionedEnvironment(std::string root, std::string bin_dir)
    : root_(std::move(root)), bin_dir_(std::move(bin_dir)) {}

const std::string &ProvisionedEnvironment::root() const { return root_; }

const std::string &ProvisionedEnvironment::bin_dir() const { return bin_dir_; }

std::string ProvisionedEnvironment::activate_script() const {
  return (fs::path(bin_dir_) / "activate").string();
}

EnvOverrides ProvisionedEnvironment::env_overrides() const {
  EnvOverrides env;
  if (root_.empty()) return env;

  env["VIRTUAL_ENV"] = root_;
  const char *path = std::getenv("PATH");
  env["PATH"] = (path && *path) ? bin_dir_ + ":" + path : bin_dir_;
  return env;
}

std::vector<std::string> ProvisionedEnvironment::search_dirs() const {
  std::vector<std::string> dirs;
  if (!bin_dir_.empty()) dirs.push_back(bin_dir_);
  for (auto &d : path_dirs_from_env()) dirs.push_back(d);
  return dirs;
}

std::optional<std::string> ProvisionedEnvironment::resolve(const std::string &executable,
                                                           const std::string &workdir) const {
  return find_executable(executable, search_dirs(), workdir);
}

// === EnvironmentProvisioner ===

EnvironmentProvisioner::EnvironmentProvisioner(CommandRunner &runner, const OrchestrationConfig &cfg)
    : runner_(runner),
      create_cmd_(cfg.env_create_cmd),
      sync_cmd_(cfg.env_sync_cmd),
      bin_dir_name_(cfg.env_bin_dir) {}

bool EnvironmentProvisioner::created_last_run() const { return created_last_run_; }

ProvisionedEnvironment EnvironmentProvisioner::ensure(EnvironmentDescriptor &descriptor) {
  created_last_run_ = false;

  if (descriptor.root_path.empty())
    throw ProvisioningError("environment root path is empty");

  std::error_code ec;
  descriptor.is_provisioned = fs::exists(descriptor.root_path, ec);

  if (!descriptor.is_provisioned) {
    create_root(descriptor);
    created_last_run_ = true;
  } else {
    log_info("env", "reusing environment at " + descriptor.root_path);
  }

  const std::string root = absolute_path(descriptor.root_path);
  ProvisionedEnvironment env(root, (fs::path(root) / bin_dir_name_).string());

  sync_manifest(descriptor, env);

  descriptor.is_provisioned = true;
  return env;
}

void EnvironmentProvisioner::create_root(const EnvironmentDescriptor &descriptor) {
  if (create_cmd_.empty())
    throw ProvisioningError("no environment creation command configured");

  std::vector<std::string> argv = create_cmd_;
  argv.push_back(descriptor.root_path);

  log_info("env", "creating environment: " + shell_join(argv));
  CommandResult res = runner_.run(argv);
  if (!res.ok()) {
    throw ProvisioningError("environment creation failed (exit " + std::to_string(res.exit_code) +
                            "): " + tail_lines(res.output, 5));
  }
}

void EnvironmentProvisioner::sync_manifest(const EnvironmentDescriptor &descriptor,
                                           const ProvisionedEnvironment &env) {
  std::error_code ec;
  if (!fs::exists(descriptor.manifest_path, ec))
    throw ProvisioningError("dependency manifest not found: " + descriptor.manifest_path);
  if (sync_cmd_.empty())
    throw ProvisioningError("no dependency sync command configured");

  std::vector<std::string> argv = sync_cmd_;
  // prefer the environment's own copy of the tool (pip inside the venv)
  if (argv[0].find('/') == std::string::npos) {
    fs::path local = fs::path(env.bin_dir()) / argv[0];
    if (fs::exists(local, ec)) argv[0] = local.string();
  }
  argv.push_back(descriptor.manifest_path);

  RunOptions opts;
  opts.env = env.env_overrides();

  log_info("env", "syncing dependencies: " + shell_join(argv));
  CommandResult res = runner_.run(argv, opts);
  if (!res.ok()) {
    throw ProvisioningError("dependency sync failed (exit " + std::to_string(res.exit_code) +
                            "): " + tail_lines(res.output, 5));
  }
}
