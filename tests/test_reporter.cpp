#include "../include/view/reporter.hpp"
#include "../include/data_structures/buffered_channel.hpp"
#include "fakes.hpp"
#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>

static RunReport partial_report() {
  RunReport report;
  report.final_state = OrchestratorState::COMPLETE;
  report.session_name = "game_system";
  report.elapsed = std::chrono::milliseconds(3012);

  ServiceResult db{"database", LaunchStatus::LAUNCHED, 0u};
  ServiceResult dev{"developer", LaunchStatus::EXITED_EARLY, 1u, 1};
  ServiceResult player{"player", LaunchStatus::SKIPPED};
  player.detail = "dependency database is failed";
  report.results = {db, dev, player};
  return report;
}

void test_summary() {
  FakeSupervisor sup;
  Reporter reporter(sup);

  RunReport report = partial_report();
  assert(report.exit_code() == 2);
  std::string text = reporter.build_summary(report);
  std::cout << text;
  assert(text.find("PARTIAL: session game_system") != std::string::npos);
  assert(text.find("exited-early") != std::string::npos);
  assert(text.find("exit code 1") != std::string::npos);
  assert(text.find("dependency database is failed") != std::string::npos);

  RunReport aborted;
  aborted.final_state = OrchestratorState::ABORTED;
  aborted.abort_reason = "dependency sync failed (exit 1)";
  aborted.results = {ServiceResult{"database", LaunchStatus::UNKNOWN}};
  text = reporter.build_summary(aborted);
  assert(text.find("ABORTED: dependency sync failed") != std::string::npos);
  assert(text.find("unknown") != std::string::npos);
  assert(aborted.exit_code() == 1);
  std::cout << "Summary rendered.\n";
}

void test_status_and_help() {
  FakeSupervisor sup;
  Reporter reporter(sup);

  assert(reporter.build_status("game_system", std::nullopt).find("No fake session") != std::string::npos);

  SessionHandle s{"game_system", {}};
  WindowHandle running;
  running.index = 0;
  running.label = "database";
  running.is_alive = true;
  WindowHandle exited;
  exited.index = 1;
  exited.label = "developer";
  exited.exit_code = 3;
  s.windows = {running, exited};

  std::string status = reporter.build_status("game_system", s);
  assert(status.find("2 windows") != std::string::npos);
  assert(status.find("running") != std::string::npos);
  assert(status.find("exited (3)") != std::string::npos);

  // killed before it could record a status
  WindowHandle killed;
  killed.index = 2;
  killed.label = "player";
  s.windows.push_back(killed);
  status = reporter.build_status("game_system", s);
  assert(status.find("3 windows") != std::string::npos);
  assert(status.find("player      exited\n") != std::string::npos);

  assert(reporter.operator_help("game_system").find("fake attach game_system") != std::string::npos);
  std::cout << "Status and operator help rendered.\n";
}

void test_write_log() {
  TempDir dir;
  FakeSupervisor sup;
  Reporter reporter(sup);

  BufferedChannel<std::string> history(2, true);
  history.send("first");
  history.send("second");
  history.send("third"); // drops "first"
  assert(history.size() == 2);
  assert(history.snapshot() == "second\nthird\n");

  std::string path = dir.file("launcher-log.txt");
  assert(reporter.write_log(path, partial_report(), history.items()));
  assert(reporter.write_log(path, partial_report(), history.items()));

  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  std::string text = ss.str();
  assert(text.find("first") == std::string::npos);
  assert(text.find("third") != std::string::npos);
  // appended, not truncated
  assert(text.find("=== run at") != text.rfind("=== run at"));

  assert(!reporter.write_log(dir.file("missing/dir/log.txt"), partial_report(), {}));
  std::cout << "Run log appended.\n";
}

int main() {
  test_summary();
  test_status_and_help();
  test_write_log();
  std::cout << "All reporter tests passed.\n";
  return 0;
}
