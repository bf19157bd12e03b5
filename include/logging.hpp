#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace fragcast {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    const char* level_str(LogLevel lvl);
};

// Accepts "trace", "debug", "info", "warn" or "error".
bool parse_log_level(const std::string& s, LogLevel& out);

} // namespace fragcast
