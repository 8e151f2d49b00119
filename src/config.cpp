#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

static bool parse_u32(const std::string &value, uint32_t &out) {
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) return false;
  try {
    size_t used = 0;
    unsigned long long v = std::stoull(value, &used);
    if (used != value.size() || v > std::numeric_limits<uint32_t>::max()) return false;
    out = static_cast<uint32_t>(v);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

static void warn_line(const std::string &origin, int line_no, const std::string &msg) {
  std::cerr << "Warning: " << origin << ":" << line_no << ": " << msg << "\n";
}

SupervisorBackend parse_backend(const std::string &value) {
  std::string v = to_lower(value);
  if (v == "screen") return SupervisorBackend::SCREEN;
  if (v == "native") return SupervisorBackend::NATIVE;
  throw ConfigError("unknown backend '" + value + "' (use screen|native)");
}

std::string backend_name(SupervisorBackend backend) {
  return backend == SupervisorBackend::SCREEN ? "screen" : "native";
}

OrchestrationConfig parse_config(std::istream &in, const std::string &origin) {
  OrchestrationConfig cfg{};

  std::vector<ServiceSpec> declared;
  std::vector<std::pair<std::string, std::string>> depends;   // service -> dependency
  std::vector<std::pair<std::string, ProbeTarget>> probes;

  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    size_t hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);

    auto tokens = split(line);
    if (tokens.empty()) continue;

    const std::string key = to_lower(tokens[0]);
    std::vector<std::string> rest(tokens.begin() + 1, tokens.end());
    const std::string value = rest.empty() ? std::string() : rest[0];

    if (key == "service") {
      // service <label> <settle_ms> <workdir> <command...>
      if (rest.size() < 4) {
        warn_line(origin, line_no, "service needs <label> <settle_ms> <workdir> <command...>");
        continue;
      }
      ServiceSpec svc;
      svc.name = rest[0];
      uint32_t settle = 0;
      if (!parse_u32(rest[1], settle)) {
        warn_line(origin, line_no, "invalid settle delay '" + rest[1] + "' for " + rest[0]);
        continue;
      }
      svc.settle_delay = std::chrono::milliseconds(settle);
      svc.working_dir = rest[2];
      svc.command.assign(rest.begin() + 3, rest.end());
      declared.push_back(std::move(svc));
    }
    else if (key == "depends") {
      if (rest.size() != 2) { warn_line(origin, line_no, "depends needs <label> <dependency>"); continue; }
      depends.emplace_back(rest[0], rest[1]);
    }
    else if (key == "probe") {
      if (rest.size() != 3) { warn_line(origin, line_no, "probe needs <label> <HOST_KEY> <PORT_KEY>"); continue; }
      probes.emplace_back(rest[0], ProbeTarget{rest[1], rest[2]});
    }
    else if (rest.empty()) {
      warn_line(origin, line_no, "missing value for '" + key + "'");
    }
    else if (key == "session-name") cfg.session_name = value;
    else if (key == "backend") cfg.backend = parse_backend(value);
    else if (key == "env-root") cfg.env_root = value;
    else if (key == "env-manifest") cfg.env_manifest = value;
    else if (key == "env-create-cmd") cfg.env_create_cmd = rest;
    else if (key == "env-sync-cmd") cfg.env_sync_cmd = rest;
    else if (key == "env-bin-dir") cfg.env_bin_dir = value;
    else if (key == "network-env") cfg.network_env = value;
    else if (key == "state-dir") cfg.state_dir = value;
    else if (key == "log-file") cfg.log_file = value;
    else if (key == "readiness") {
      std::string v = to_lower(value);
      if (v == "fixed") cfg.readiness = ReadinessPolicy::FIXED;
      else if (v == "tcp") cfg.readiness = ReadinessPolicy::TCP;
      else warn_line(origin, line_no, "unknown readiness policy '" + value + "', keeping fixed");
    }
    else if (key == "probe-retries" || key == "probe-backoff-ms" ||
             key == "probe-backoff-max-ms" || key == "strict-readiness") {
      uint32_t v = 0;
      if (!parse_u32(value, v)) {
        warn_line(origin, line_no, "invalid number '" + value + "' for " + key);
        continue;
      }
      if (key == "probe-retries") cfg.probe_retries = v;
      else if (key == "probe-backoff-ms") cfg.probe_backoff_ms = v;
      else if (key == "probe-backoff-max-ms") cfg.probe_backoff_max_ms = v;
      else cfg.strict_readiness = (v != 0);
    }
    else {
      warn_line(origin, line_no, "unknown key '" + key + "'");
    }
  }

  // Declared services replace the built-in deployment as a whole.
  if (!declared.empty()) cfg.services = std::move(declared);

  for (const auto &[name, dep] : depends) {
    bool found = false;
    for (auto &svc : cfg.services)
      if (svc.name == name) { svc.depends_on = dep; found = true; }
    if (!found) throw ConfigError("depends: unknown service '" + name + "'");
  }
  for (const auto &[name, target] : probes) {
    bool found = false;
    for (auto &svc : cfg.services)
      if (svc.name == name) { svc.probe = target; found = true; }
    if (!found) throw ConfigError("probe: unknown service '" + name + "'");
  }

  if (!is_plain_name(cfg.session_name))
    throw ConfigError("invalid session-name '" + cfg.session_name + "' (no '/', whitespace, '.' or '..')");
  if (cfg.probe_retries == 0) cfg.probe_retries = 1;
  if (cfg.probe_backoff_max_ms < cfg.probe_backoff_ms) cfg.probe_backoff_max_ms = cfg.probe_backoff_ms;

  validate_services(cfg.services);
  return cfg;
}

OrchestrationConfig load_config(const std::string &path) {
  std::ifstream in(path);

  if (!in) {
    // keep defaults if file missing
    return OrchestrationConfig{};
  }
  return parse_config(in, path);
}
