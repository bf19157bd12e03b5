#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace fragcast {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }
const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level_)
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::fprintf(stderr, "%s.%03d [%s] ", ts, (int)ms, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "\n");
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char ch) { return (char)std::tolower(ch); });
  if (v == "trace")
    out = LogLevel::TRACE;
  else if (v == "debug")
    out = LogLevel::DEBUG;
  else if (v == "info")
    out = LogLevel::INFO;
  else if (v == "warn" || v == "warning")
    out = LogLevel::WARN;
  else if (v == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

} // namespace fragcast
