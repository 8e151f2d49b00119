#include "../include/environment/network_env.hpp"
#include "fakes.hpp"
#include <cassert>
#include <iostream>

void test_parse() {
  NetworkEnv env = parse_network_env(
      "# game store network\n"
      "SERVER_HOST=127.0.0.1\n"
      "export PLAYER_PORT=5001\n"
      "DEVELOPER_PORT = 5002   # dev console\n"
      "DB_HOST=\"localhost\"\n"
      "DB_PORT='5432'\n"
      "not a pair\n"
      "=orphan\n");

  assert(env.loaded());
  assert(env.get("SERVER_HOST") == "127.0.0.1");
  assert(env.get("PLAYER_PORT") == "5001");
  assert(env.get("DEVELOPER_PORT") == "5002");
  assert(env.get("DB_HOST") == "localhost");
  assert(env.get("DB_PORT") == "5432");
  assert(!env.contains("not a pair"));
  assert(env.values().size() == 5);

  auto missing = missing_keys(env);
  assert(missing.size() == 1 && missing[0] == "GAME_SERVER_PORT_BASE");
  std::cout << "Env file parsed.\n";
}

void test_endpoint() {
  NetworkEnv env = parse_network_env("DB_HOST=db\nDB_PORT=5432\nBAD_PORT=99999\nTEXT_PORT=abc\n");

  auto ep = env.endpoint({"DB_HOST", "DB_PORT"});
  assert(ep && ep->host == "db" && ep->port == 5432);
  assert(!env.endpoint({"DB_HOST", "BAD_PORT"}));
  assert(!env.endpoint({"DB_HOST", "TEXT_PORT"}));
  assert(!env.endpoint({"NO_HOST", "DB_PORT"}));
  std::cout << "Endpoints resolved.\n";
}

void test_load() {
  NetworkEnv absent = load_network_env("/nonexistent/.env");
  assert(!absent.loaded());
  assert(missing_keys(absent).size() == required_network_keys().size());

  TempDir dir;
  std::string path = dir.write(".env", "SERVER_HOST=0.0.0.0\nPLAYER_PORT=1\nDEVELOPER_PORT=2\n"
                                       "DB_HOST=h\nDB_PORT=3\nGAME_SERVER_PORT_BASE=6000\n");
  NetworkEnv env = load_network_env(path);
  assert(env.loaded());
  assert(missing_keys(env).empty());
  std::cout << "Env file loaded from disk.\n";
}

void test_invalid_keys() {
  NetworkEnv env = parse_network_env(
      "SERVER_HOST=127.0.0.1\n"
      "BAD KEY=1\n"
      "1X=2\n"
      "X;rm -rf ~=3\n"
      "PORT$(id)=4\n"
      "_PRIVATE=5\n"
      "db_port2=6\n");

  assert(env.values().size() == 3);
  assert(env.get("SERVER_HOST") == "127.0.0.1");
  assert(env.get("_PRIVATE") == "5");
  assert(env.get("db_port2") == "6");
  assert(!env.contains("BAD KEY"));
  assert(!env.contains("1X"));
  for (const auto &[key, value] : env.values())
    assert(key.find_first_of(" ;$()~-") == std::string::npos);
  std::cout << "Keys that are not variable names skipped.\n";
}

int main() {
  test_parse();
  test_endpoint();
  test_invalid_keys();
  test_load();
  std::cout << "All network env tests passed.\n";
  return 0;
}
