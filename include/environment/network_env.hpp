#pragma once
#include "services/service_spec.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Host/port pair a service is expected to listen on.
struct Endpoint {
  std::string host;
  uint16_t port{0};
};

/**
 * The network parameters the launched services read from the `.env` file in
 * the working root. The orchestrator never interprets them beyond resolving
 * probe endpoints and passing them on to the windows it creates.
 */
class NetworkEnv {
public:
  NetworkEnv() = default;
  explicit NetworkEnv(std::map<std::string, std::string> values);

  bool loaded() const;

  bool contains(const std::string &key) const;
  std::optional<std::string> get(const std::string &key) const;
  const std::map<std::string, std::string> &values() const;

  // nullopt if either key is missing or the port is not a valid number
  std::optional<Endpoint> endpoint(const ProbeTarget &target) const;

private:
  std::map<std::string, std::string> values_;
  bool loaded_{false};
};

const std::vector<std::string> &required_network_keys();

// KEY=VALUE lines, `#` comments, optional `export ` prefix and quotes.
// Keys that are not shell variable names are skipped with a warning.
// A missing file gives an empty, not-loaded NetworkEnv.
NetworkEnv load_network_env(const std::string &path);
NetworkEnv parse_network_env(const std::string &text);

std::vector<std::string> missing_keys(const NetworkEnv &env);
