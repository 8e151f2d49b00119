#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <syncstream>

std::string now_iso() {
  std::time_t t = std::time(nullptr);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return std::string(buf);
}

std::string trim(std::string s) {
  auto notspace = [](unsigned char ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
  s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
  return s;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> split(const std::string &line) {
  std::istringstream iss(line);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

std::string join(const std::vector<std::string> &parts, const std::string &sep) {
  std::ostringstream oss;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) oss << sep;
    oss << parts[i];
  }
  return oss.str();
}

std::string shell_quote(const std::string &word) {
  if (!word.empty() &&
      std::all_of(word.begin(), word.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == '/' || c == '=' || c == ':';
      }))
    return word;

  std::string out = "'";
  for (char c : word) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

std::string shell_join(const std::vector<std::string> &argv) {
  std::vector<std::string> quoted;
  quoted.reserve(argv.size());
  for (const auto &a : argv) quoted.push_back(shell_quote(a));
  return join(quoted, " ");
}

bool is_plain_name(const std::string &name) {
  if (name.empty() || name == "." || name == "..") return false;
  return std::none_of(name.begin(), name.end(), [](unsigned char c) {
    return c == '/' || std::isspace(c) || std::iscntrl(c);
  });
}

std::string tail_lines(const std::string &text, size_t max_lines) {
  if (max_lines == 0) return {};
  size_t pos = text.size();
  // ignore a trailing newline so it does not count as an empty line
  if (pos > 0 && text[pos - 1] == '\n') --pos;
  size_t seen = 0;
  while (pos > 0) {
    size_t nl = text.rfind('\n', pos - 1);
    if (nl == std::string::npos) return text;
    if (++seen == max_lines) return text.substr(nl + 1);
    pos = nl;
  }
  return text;
}

static const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::INFO:  return "INFO";
  case LogLevel::WARN:  return "WARN";
  case LogLevel::ERROR: return "ERROR";
  }
  return "INFO";
}

std::string format_log_line(LogLevel level, const std::string &component, const std::string &msg) {
  std::ostringstream oss;
  oss << "[" << now_iso() << "] [" << level_name(level) << "] [" << component << "] " << msg;
  return oss.str();
}

void log_line(LogLevel level, const std::string &component, const std::string &msg) {
  if (level == LogLevel::INFO)
    std::osyncstream(std::cout) << format_log_line(level, component, msg) << "\n";
  else
    std::osyncstream(std::cerr) << format_log_line(level, component, msg) << "\n";
}
