#include "../include/kernel/screen_supervisor.hpp"
#include "../include/errors.hpp"
#include "fakes.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <set>

// Minimal stand-in for the screen binary: tracks live session names.
struct ScreenModel {
  std::set<std::string> live;
  bool quit_works{true};
  bool create_works{true};
  int linger_after_quit{0};           // -ls calls that still list a quit session
  std::map<std::string, int> closing; // session -> listings left before it is gone

  CommandResult operator()(const std::vector<std::string> &argv) {
    if (argv.size() >= 3 && argv[1] == "-ls") {
      auto it = closing.find(argv[2]);
      if (it != closing.end() && it->second-- <= 0) {
        live.erase(argv[2]);
        closing.erase(it);
      }
      if (!live.contains(argv[2])) return {1, "No Sockets found in /run/screen/S-root.\n"};
      return {1, "There is a screen on:\n\t4242." + argv[2] + "\t(Detached)\n1 Socket in /run/screen/S-root.\n"};
    }
    if (argv.size() >= 3 && argv[1] == "-dmS") {
      if (create_works) live.insert(argv[2]);
      return {0, ""};
    }
    if (argv.size() >= 5 && argv[1] == "-S" && argv[4] == "quit") {
      if (!quit_works) return {0, ""};
      if (linger_after_quit > 0) closing[argv[2]] = linger_after_quit;
      else live.erase(argv[2]);
      return {0, ""};
    }
    if (argv.size() >= 5 && argv[1] == "-S" && argv[4] == "screen")
      return live.contains(argv[2]) ? CommandResult{0, ""} : CommandResult{1, "No screen session found.\n"};
    return {0, ""};
  }
};

static WindowCommand window(const std::string &label, const std::string &workdir) {
  WindowCommand cmd;
  cmd.label = label;
  cmd.argv = {"python", "server/" + label + ".py"};
  cmd.workdir = workdir;
  cmd.activate_script = workdir + "/.venv/bin/activate";
  cmd.env["DB_PORT"] = "5432";
  return cmd;
}

void test_parse_session_list() {
  auto names = ScreenSupervisor::parse_session_list(
      "There are screens on:\n"
      "\t12345.game_system\t(Detached)\n"
      "\t777.other.name\t(Attached)\n"
      "\tabc.bogus\t(Detached)\n"
      "2 Sockets in /run/screen/S-root.\n");
  assert(names.size() == 2);
  assert(names[0] == "game_system");
  assert(names[1] == "other.name");
  assert(ScreenSupervisor::parse_session_list("No Sockets found in /run/screen/S-root.\n").empty());
  std::cout << "screen -ls output parsed.\n";
}

void test_session_lifecycle() {
  TempDir dir;
  ScreenModel model;
  FakeCommandRunner runner;
  runner.handler = [&model](const std::vector<std::string> &argv) { return model(argv); };
  ScreenSupervisor sup(runner, dir.file("state"));

  assert(sup.backend() == "screen");
  assert(sup.reset_session("game_system") == KillResult::NOT_FOUND);

  SessionHandle s = sup.create_session("game_system", window("database", dir.path()));
  assert(s.windows.size() == 1);
  assert(s.windows[0].index == 0);
  assert(s.windows[0].label == "database");

  const auto &create = runner.calls[runner.calls.size() - 2]; // followed by the -ls check
  assert((std::vector<std::string>(create.begin(), create.begin() + 7) ==
          std::vector<std::string>{"screen", "-dmS", "game_system", "-t", "database", "bash", "-c"}));
  const std::string &script = create[7];
  assert(script.find("export DB_PORT=5432;") != std::string::npos);
  assert(script.find(". " + dir.path() + "/.venv/bin/activate && cd " + dir.path() + " && ") != std::string::npos);
  assert(script.find("python server/database.py; echo $? > ") != std::string::npos);
  assert(script.size() > 10 && script.substr(script.size() - 10) == "; exec bash");

  WindowHandle dev = sup.add_window(s, window("developer", dir.path()));
  WindowHandle player = sup.add_window(s, window("player", dir.path()));
  assert(dev.index == 1 && player.index == 2);
  const auto &add = runner.calls.back();
  assert(add[0] == "screen" && add[1] == "-S" && add[2] == "game_system" && add[3] == "-X");
  assert(add[4] == "screen" && add[6] == "player" && add[7] == "2");

  // windows survive their commands through the exit marker
  std::ofstream(s.windows[0].exit_marker) << "1\n";
  sup.refresh(s);
  assert(!s.windows[0].is_alive && *s.windows[0].exit_code == 1);
  assert(s.windows[1].is_alive);

  auto found = sup.find_session("game_system");
  assert(found && found->windows.size() == 3);
  assert(found->windows[2].label == "player");

  assert(sup.reset_session("game_system") == KillResult::KILLED);
  assert(!sup.has_session("game_system"));
  assert(!sup.find_session("game_system"));
  std::cout << "Screen session created, extended and reset.\n";
}

void test_failures() {
  TempDir dir;
  ScreenModel model;
  FakeCommandRunner runner;
  runner.handler = [&model](const std::vector<std::string> &argv) { return model(argv); };
  ScreenSupervisor sup(runner, dir.file("state"));

  model.create_works = false;
  bool thrown = false;
  try {
    sup.create_session("game_system", window("database", dir.path()));
  } catch (const SessionCreationError &) {
    thrown = true;
  }
  assert(thrown);

  model.create_works = true;
  SessionHandle s = sup.create_session("game_system", window("database", dir.path()));
  SessionHandle stale{"gone", {}};
  thrown = false;
  try {
    sup.add_window(stale, window("developer", dir.path()));
  } catch (const LaunchFailure &e) {
    thrown = true;
    assert(e.service() == "developer");
  }
  assert(thrown);

  model.quit_works = false;
  sup.set_quit_timeout(std::chrono::milliseconds(120));
  assert(sup.reset_session("game_system") == KillResult::KILL_FAILED);
  assert(sup.has_session("game_system"));

  auto help = sup.operator_commands("game_system");
  assert(help.size() == 4);
  assert(help[0].find("screen -r game_system") != std::string::npos);
  assert(help[3].find("screen -S game_system -X quit") != std::string::npos);
  (void)s;
  std::cout << "Screen failures surfaced.\n";
}

void test_quit_settles() {
  TempDir dir;
  ScreenModel model;
  model.linger_after_quit = 3;
  FakeCommandRunner runner;
  runner.handler = [&model](const std::vector<std::string> &argv) { return model(argv); };
  ScreenSupervisor sup(runner, dir.file("state"));

  sup.create_session("game_system", window("database", dir.path()));
  size_t before = runner.calls.size();
  assert(sup.reset_session("game_system") == KillResult::KILLED);
  assert(!sup.has_session("game_system"));

  // first -ls, quit, then -ls until the socket is gone
  size_t listings = 0;
  for (size_t i = before; i < runner.calls.size(); ++i)
    if (runner.calls[i][1] == "-ls") ++listings;
  assert(listings >= 5);

  // a session that never goes away is reported once the wait runs out
  model.linger_after_quit = 1000;
  sup.set_quit_timeout(std::chrono::milliseconds(150));
  sup.create_session("game_system", window("database", dir.path()));
  auto start = std::chrono::steady_clock::now();
  assert(sup.kill("game_system") == KillResult::KILL_FAILED);
  assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(150));
  std::cout << "Slow screen quit waited out.\n";
}

int main() {
  test_parse_session_list();
  test_session_lifecycle();
  test_failures();
  test_quit_settles();
  std::cout << "All screen supervisor tests passed.\n";
  return 0;
}
