#include "view/reporter.hpp"
#include "util.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

static const char *RULE = "------------------------------------------------\n";

Reporter::Reporter(ProcessSupervisor &supervisor) : supervisor_(supervisor) {}

std::string Reporter::build_summary(const RunReport &report) const {
  std::ostringstream oss;
  oss << RULE;
  if (report.final_state == OrchestratorState::COMPLETE) {
    oss << (report.all_launched() ? "SUCCESS" : "PARTIAL") << ": session " << report.session_name
        << " (" << state_name(report.final_state) << " in " << report.elapsed.count() << " ms)\n";
  } else {
    oss << "ABORTED: " << report.abort_reason << "\n";
  }
  oss << RULE;

  oss << std::left << std::setw(6) << "Win" << std::setw(14) << "Service" << std::setw(14) << "Status"
      << "Detail\n";
  for (const auto &r : report.results) {
    std::string win = r.window_index ? std::to_string(*r.window_index) : "-";
    std::string detail = r.detail;
    if (r.status == LaunchStatus::EXITED_EARLY && r.exit_code)
      detail = "exit code " + std::to_string(*r.exit_code);
    oss << std::left << std::setw(6) << win << std::setw(14) << r.service
        << std::setw(14) << launch_status_name(r.status) << detail << "\n";
  }
  oss << RULE;
  return oss.str();
}

std::string Reporter::operator_help(const std::string &session) const {
  std::ostringstream oss;
  oss << "Servers are running in " << supervisor_.backend() << " session: " << session << "\n";
  for (const auto &line : supervisor_.operator_commands(session)) oss << "  " << line << "\n";
  oss << RULE;
  return oss.str();
}

std::string Reporter::build_status(const std::string &session_name,
                                   const std::optional<SessionHandle> &session) const {
  std::ostringstream oss;
  if (!session) {
    oss << "No " << supervisor_.backend() << " session named " << session_name << ".\n";
    return oss.str();
  }
  oss << "Session " << session->name << " (" << supervisor_.backend() << "), "
      << session->windows.size() << " windows\n";
  for (const auto &w : session->windows) {
    oss << "  [" << w.index << "] " << std::left << std::setw(12) << w.label;
    if (w.is_alive) oss << "running";
    else if (w.exit_code) oss << "exited (" << *w.exit_code << ")";
    else oss << "exited";
    oss << "\n";
  }
  return oss.str();
}

bool Reporter::write_log(const std::string &path, const RunReport &report,
                         const std::vector<std::string> &logs) const {
  std::ofstream out(path, std::ios::app);
  if (!out) return false;

  out << "=== run at " << now_iso() << " ===\n";
  for (const auto &line : logs) out << line << "\n";
  out << build_summary(report) << "\n";
  return static_cast<bool>(out);
}
