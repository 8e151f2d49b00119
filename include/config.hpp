#pragma once
#include "services/service_spec.hpp"
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

enum class SupervisorBackend {
  SCREEN, // GNU screen named session
  NATIVE  // process groups + on-disk session manifest
};

enum class ReadinessPolicy {
  FIXED, // settle delay only
  TCP    // settle delay, then TCP connect probe with backoff
};

struct OrchestrationConfig {
  std::string session_name = "game_system";
  SupervisorBackend backend = SupervisorBackend::SCREEN;

  // Dependency environment
  std::string env_root = ".venv";
  std::string env_manifest = "requirements.txt";
  std::vector<std::string> env_create_cmd = {"python3", "-m", "venv"}; // env root appended
  std::vector<std::string> env_sync_cmd = {"pip", "install", "-r"};    // manifest appended
  std::string env_bin_dir = "bin";

  std::string network_env = ".env";
  std::string state_dir = ".launcher";

  // Readiness
  ReadinessPolicy readiness = ReadinessPolicy::FIXED;
  uint32_t probe_retries = 5;
  uint32_t probe_backoff_ms = 200;
  uint32_t probe_backoff_max_ms = 3200;
  bool strict_readiness = false;

  std::string log_file = "launcher-log.txt";

  std::vector<ServiceSpec> services = default_services();
};

// Missing file keeps the defaults. Throws ConfigError on an invalid service list.
OrchestrationConfig load_config(const std::string &path);
OrchestrationConfig parse_config(std::istream &in, const std::string &origin);

SupervisorBackend parse_backend(const std::string &value);
std::string backend_name(SupervisorBackend backend);
