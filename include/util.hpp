#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <sstream>

std::string now_iso();
std::string trim(std::string s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string &line);
std::string join(const std::vector<std::string> &parts, const std::string &sep);

// Single-quote a word for /bin/sh, escaping embedded quotes.
std::string shell_quote(const std::string &word);
std::string shell_join(const std::vector<std::string> &argv);

// Last `max_lines` lines of `text`, used when surfacing tool output in errors.
std::string tail_lines(const std::string &text, size_t max_lines);

// Usable as a single path component: not empty, not "." or "..", no '/'
// and no whitespace or control characters.
bool is_plain_name(const std::string &name);

enum class LogLevel {
  INFO,
  WARN,
  ERROR
};

void log_line(LogLevel level, const std::string &component, const std::string &msg);
std::string format_log_line(LogLevel level, const std::string &component, const std::string &msg);

inline void log_info(const std::string &component, const std::string &msg) {
  log_line(LogLevel::INFO, component, msg);
}
inline void log_warn(const std::string &component, const std::string &msg) {
  log_line(LogLevel::WARN, component, msg);
}
inline void log_error(const std::string &component, const std::string &msg) {
  log_line(LogLevel::ERROR, component, msg);
}


//#define DEBUG
#define DEBUG_ORCHESTRATOR false
#define DEBUG_SUPERVISOR false

#ifdef DEBUG
    #warning "Debug-printing is active"
    #define DEBUG_PRINT(condition, msg, ...) \
      if (condition) \
        printf("[%s:%s():%d] " msg "\n", __FILE__, __func__, __LINE__, ##__VA_ARGS__);
#else
    #define DEBUG_PRINT(condition, msg, ...)
#endif
