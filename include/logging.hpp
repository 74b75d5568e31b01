
#pragma once
#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace scanlink {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

// "trace" .. "error"
bool parse_log_level(const std::string& s, LogLevel& out);

// Process-wide stderr logger. Lines from io threads carry a short thread tag.
class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel lvl) const { return lvl >= level_.load(); }
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
};

} // namespace scanlink
