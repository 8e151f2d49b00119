#include "kernel/dependency_gate.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

// === TCP probe ===

bool tcp_connect(const Endpoint &ep, std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *res = nullptr;
  const std::string port = std::to_string(ep.port);
  if (::getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res) != 0 || !res) return false;

  bool connected = false;
  for (addrinfo *ai = res; ai && !connected; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) continue;

    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc == 0) {
      connected = true;
    } else if (errno == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      if (::poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0)
          connected = true;
      }
    }
    ::close(fd);
  }
  ::freeaddrinfo(res);
  return connected;
}

TcpPortProbe::TcpPortProbe(NetworkEnv env, std::chrono::milliseconds connect_timeout)
    : env_(std::move(env)), connect_timeout_(connect_timeout) {}

bool TcpPortProbe::is_ready(const ServiceSpec &spec) {
  if (!spec.probe) return true;

  auto ep = env_.endpoint(*spec.probe);
  if (!ep) {
    log_warn("gate", spec.name + ": no usable " + spec.probe->host_key + "/" + spec.probe->port_key +
                         " in network env, skipping probe");
    return true;
  }
  return tcp_connect(*ep, connect_timeout_);
}

// === RetryPolicy ===

std::chrono::milliseconds RetryPolicy::backoff_for(uint32_t retry) const {
  auto wait = initial_backoff;
  for (uint32_t i = 0; i < retry && wait < max_backoff; ++i) wait *= 2;
  return wait < max_backoff ? wait : max_backoff;
}

// === DependencyGate ===

DependencyGate::DependencyGate() : DependencyGate(nullptr, RetryPolicy{}) {}

DependencyGate::DependencyGate(std::shared_ptr<ReadinessProbe> probe, RetryPolicy policy)
    : probe_(std::move(probe)), policy_(policy),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
  if (policy_.attempts == 0) policy_.attempts = 1;
}

void DependencyGate::set_sleep(SleepFn fn) { sleep_ = std::move(fn); }

bool DependencyGate::has_probe() const { return probe_ != nullptr; }

void DependencyGate::wait_for_settle(const ServiceSpec &spec) {
  if (spec.settle_delay.count() > 0) {
    DEBUG_PRINT(DEBUG_ORCHESTRATOR, "settle %s for %lld ms", spec.name.c_str(),
                (long long)spec.settle_delay.count());
    sleep_(spec.settle_delay);
  }

  if (!probe_ || !spec.probe) return;

  for (uint32_t attempt = 0; attempt < policy_.attempts; ++attempt) {
    if (probe_->is_ready(spec)) {
      if (attempt > 0) log_info("gate", spec.name + " ready after " + std::to_string(attempt + 1) + " probes");
      return;
    }
    if (attempt + 1 < policy_.attempts) sleep_(policy_.backoff_for(attempt));
  }
  throw DependencyNotReadyError(spec.name, policy_.attempts);
}
