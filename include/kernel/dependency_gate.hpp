#pragma once
#include "environment/network_env.hpp"
#include "services/service_spec.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

// Active readiness check for a launched service.
class ReadinessProbe {
public:
  virtual ~ReadinessProbe() = default;
  virtual bool is_ready(const ServiceSpec &spec) = 0;
};

// Ready once a TCP connect to the service's host/port succeeds. Services
// without probe keys, or whose keys are missing from the env, count as ready.
class TcpPortProbe : public ReadinessProbe {
public:
  explicit TcpPortProbe(NetworkEnv env, std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(500));
  bool is_ready(const ServiceSpec &spec) override;

private:
  NetworkEnv env_;
  std::chrono::milliseconds connect_timeout_;
};

bool tcp_connect(const Endpoint &ep, std::chrono::milliseconds timeout);

struct RetryPolicy {
  uint32_t attempts{5};
  std::chrono::milliseconds initial_backoff{200};
  std::chrono::milliseconds max_backoff{3200};

  // Wait before retry number `retry` (0-based), doubling up to max_backoff.
  std::chrono::milliseconds backoff_for(uint32_t retry) const;
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

/**
 * Holds the orchestrator back after a launch. The settle delay is always
 * served in full; with a probe installed, the service must then also answer
 * it within the retry policy.
 */
class DependencyGate {
public:
  DependencyGate();
  DependencyGate(std::shared_ptr<ReadinessProbe> probe, RetryPolicy policy);

  // Throws DependencyNotReadyError when the probe never succeeds.
  void wait_for_settle(const ServiceSpec &spec);

  void set_sleep(SleepFn fn);
  bool has_probe() const;

private:
  std::shared_ptr<ReadinessProbe> probe_;
  RetryPolicy policy_;
  SleepFn sleep_;
};
