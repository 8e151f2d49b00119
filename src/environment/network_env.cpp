#include "environment/network_env.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

NetworkEnv::NetworkEnv(std::map<std::string, std::string> values)
    : values_(std::move(values)), loaded_(true) {}

bool NetworkEnv::loaded() const { return loaded_; }

bool NetworkEnv::contains(const std::string &key) const { return values_.contains(key); }

std::optional<std::string> NetworkEnv::get(const std::string &key) const {
  auto it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

const std::map<std::string, std::string> &NetworkEnv::values() const { return values_; }

std::optional<Endpoint> NetworkEnv::endpoint(const ProbeTarget &target) const {
  auto host = get(target.host_key);
  auto port = get(target.port_key);
  if (!host || !port || host->empty()) return std::nullopt;

  try {
    size_t used = 0;
    unsigned long p = std::stoul(*port, &used);
    if (used != port->size() || p == 0 || p > 65535) return std::nullopt;
    return Endpoint{*host, static_cast<uint16_t>(p)};
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

const std::vector<std::string> &required_network_keys() {
  static const std::vector<std::string> keys = {
      "SERVER_HOST", "PLAYER_PORT", "DEVELOPER_PORT",
      "DB_HOST", "DB_PORT", "GAME_SERVER_PORT_BASE"};
  return keys;
}

static std::string unquote(std::string v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
    return v.substr(1, v.size() - 2);

  // unquoted values may carry a trailing comment
  size_t hash = v.find(" #");
  if (hash != std::string::npos) v = trim(v.substr(0, hash));
  return v;
}

// [A-Za-z_][A-Za-z0-9_]*; keys are exported into window shells
static bool is_env_key(const std::string &key) {
  if (key.empty() || std::isdigit(static_cast<unsigned char>(key[0]))) return false;
  return std::all_of(key.begin(), key.end(),
                     [](unsigned char c) { return c == '_' || std::isalnum(c); });
}

NetworkEnv parse_network_env(const std::string &text) {
  std::map<std::string, std::string> values;
  std::istringstream in(text);
  std::string line;

  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

    size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0) continue;

    std::string key = trim(line.substr(0, eq));
    if (!is_env_key(key)) {
      log_warn("env", "skipping invalid key '" + key + "'");
      continue;
    }
    std::string value = unquote(trim(line.substr(eq + 1)));
    values[key] = value;
  }
  return NetworkEnv(std::move(values));
}

NetworkEnv load_network_env(const std::string &path) {
  std::ifstream in(path);
  if (!in) return NetworkEnv{};

  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_network_env(ss.str());
}

std::vector<std::string> missing_keys(const NetworkEnv &env) {
  std::vector<std::string> missing;
  for (const auto &key : required_network_keys())
    if (!env.contains(key)) missing.push_back(key);
  return missing;
}
