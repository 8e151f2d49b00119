#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "fakes.hpp"
#include <cassert>
#include <iostream>
#include <sstream>

static OrchestrationConfig parse(const std::string &text) {
  std::istringstream in(text);
  return parse_config(in, "test.conf");
}

static bool parse_throws(const std::string &text) {
  try {
    parse(text);
  } catch (const ConfigError &e) {
    std::cout << "  rejected: " << e.what() << "\n";
    return true;
  }
  return false;
}

void test_defaults() {
  OrchestrationConfig cfg = load_config("/nonexistent/launcher.conf");
  assert(cfg.session_name == "game_system");
  assert(cfg.backend == SupervisorBackend::SCREEN);
  assert(cfg.env_root == ".venv");
  assert(cfg.env_manifest == "requirements.txt");
  assert(cfg.readiness == ReadinessPolicy::FIXED);
  assert(!cfg.strict_readiness);
  assert(cfg.services.size() == 3);
  assert(cfg.services[0].name == "database");
  assert(cfg.services[1].name == "developer");
  assert(cfg.services[2].name == "player");
  std::cout << "Missing file keeps defaults.\n";
}

void test_keys() {
  OrchestrationConfig cfg = parse(
      "# launcher settings\n"
      "session-name  demo   # trailing comment\n"
      "backend NATIVE\n"
      "env-root /opt/venv\n"
      "env-manifest deps.txt\n"
      "env-create-cmd virtualenv -q\n"
      "env-sync-cmd uv pip install -r\n"
      "state-dir /tmp/state\n"
      "readiness tcp\n"
      "probe-retries 7\n"
      "probe-backoff-ms 50\n"
      "probe-backoff-max-ms 10\n"
      "strict-readiness 1\n"
      "log-file run.log\n"
      "no-such-key 3\n");

  assert(cfg.session_name == "demo");
  assert(cfg.backend == SupervisorBackend::NATIVE);
  assert(cfg.env_root == "/opt/venv");
  assert(cfg.env_manifest == "deps.txt");
  assert((cfg.env_create_cmd == std::vector<std::string>{"virtualenv", "-q"}));
  assert((cfg.env_sync_cmd == std::vector<std::string>{"uv", "pip", "install", "-r"}));
  assert(cfg.state_dir == "/tmp/state");
  assert(cfg.readiness == ReadinessPolicy::TCP);
  assert(cfg.probe_retries == 7);
  assert(cfg.probe_backoff_ms == 50);
  assert(cfg.probe_backoff_max_ms == 50); // raised to the initial backoff
  assert(cfg.strict_readiness);
  assert(cfg.log_file == "run.log");
  assert(cfg.services.size() == 3);
  std::cout << "Keys parsed.\n";
}

void test_declared_services() {
  OrchestrationConfig cfg = parse(
      "service cache 150 ./srv redis-server --port 7000\n"
      "service api 0 . python api.py\n"
      "depends api cache\n"
      "probe cache DB_HOST DB_PORT\n");

  assert(cfg.services.size() == 2);
  const ServiceSpec &cache = cfg.services[0];
  assert(cache.name == "cache");
  assert(cache.settle_delay == std::chrono::milliseconds(150));
  assert(cache.working_dir == "./srv");
  assert((cache.command == std::vector<std::string>{"redis-server", "--port", "7000"}));
  assert(cache.probe && cache.probe->port_key == "DB_PORT");
  assert(cache.window_index == 0);

  const ServiceSpec &api = cfg.services[1];
  assert(api.depends_on && *api.depends_on == "cache");
  assert(!api.probe);
  assert(api.window_index == 1);
  std::cout << "Declared services replace the defaults.\n";
}

void test_invalid() {
  assert(parse_throws("backend tmux\n"));
  assert(parse_throws("service a 0 . true\nservice a 0 . true\n"));
  assert(parse_throws("service a 0 . true\nservice b 0 . true\ndepends a b\n"));
  assert(parse_throws("service a 0 . true\ndepends a a\n"));
  assert(parse_throws("depends ghost database\n"));
  assert(parse_throws("probe ghost DB_HOST DB_PORT\n"));

  // malformed service lines are skipped with a warning, leaving the defaults
  OrchestrationConfig cfg = parse("service broken 0 .\nservice bad -5 . true\n"
                                  "service huge 4294967296 . true\n");
  assert(cfg.services.size() == 3);

  // out of range numbers keep the default instead of wrapping
  cfg = parse("probe-retries 4294967296\nprobe-backoff-ms 99999999999999999999\n");
  assert(cfg.probe_retries == 5);
  assert(cfg.probe_backoff_ms == 200);
  cfg = parse("probe-retries 4294967295\n");
  assert(cfg.probe_retries == 4294967295u);
  std::cout << "Invalid configs rejected.\n";
}

// Session and service names end up as directory and file names under the
// state dir; anything that could escape it is refused.
void test_unsafe_names() {
  assert(parse_throws("session-name ..\n"));
  assert(parse_throws("session-name .\n"));
  assert(parse_throws("session-name ../../home\n"));
  assert(parse_throws("service ../x 0 . true\n"));
  assert(parse_throws("service a/b 0 . true\n"));
  assert(parse_throws("service .. 0 . true\n"));

  OrchestrationConfig cfg = parse("session-name game.system-2\nservice db_1 0 . true\n");
  assert(cfg.session_name == "game.system-2");
  assert(cfg.services[0].name == "db_1");
  std::cout << "Unsafe session and service names rejected.\n";
}

void test_load_from_file() {
  TempDir dir;
  std::string path = dir.write("launcher.conf", "session-name from_file\nbackend native\n");
  OrchestrationConfig cfg = load_config(path);
  assert(cfg.session_name == "from_file");
  assert(cfg.backend == SupervisorBackend::NATIVE);
  assert(backend_name(cfg.backend) == "native");
  assert(parse_backend("Screen") == SupervisorBackend::SCREEN);
  std::cout << "Config loaded from file.\n";
}

int main() {
  test_defaults();
  test_keys();
  test_declared_services();
  test_invalid();
  test_unsafe_names();
  test_load_from_file();
  std::cout << "All config tests passed.\n";
  return 0;
}
