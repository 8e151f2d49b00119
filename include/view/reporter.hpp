#pragma once
#include "kernel/orchestrator.hpp"
#include "kernel/process_supervisor.hpp"
#include <optional>
#include <string>
#include <vector>

class Reporter {
public:
  explicit Reporter(ProcessSupervisor &supervisor);

  std::string build_summary(const RunReport &report) const;   // per-service table
  std::string operator_help(const std::string &session) const; // attach / detach / kill
  std::string build_status(const std::string &session_name, const std::optional<SessionHandle> &session) const;

  // Summary plus the orchestrator's log history. False if the file cannot be written.
  bool write_log(const std::string &path, const RunReport &report, const std::vector<std::string> &logs) const;

private:
  ProcessSupervisor &supervisor_;
};
