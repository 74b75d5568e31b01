#include "logging.hpp"
#include <chrono>
#include <ctime>
#include <functional>
#include <thread>

namespace scanlink {

namespace {

struct LevelName {
  const char *flag;
  const char *tag;
};

const LevelName kLevels[] = {{"trace", "TRACE"},
                             {"debug", "DEBUG"},
                             {"info", "INFO"},
                             {"warn", "WARN"},
                             {"error", "ERROR"}};

unsigned thread_tag() {
  return (unsigned)(std::hash<std::thread::id>()(std::this_thread::get_id()) &
                    0xFFFF);
}

} // namespace

bool parse_log_level(const std::string &s, LogLevel &out) {
  for (int i = 0; i < 5; i++)
    if (s == kLevels[i].flag) {
      out = static_cast<LogLevel>(i);
      return true;
    }
  return false;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::lock_guard<std::mutex> lk(mtx_);
  std::fprintf(stderr, "%s.%03d [%s] (%04x) ", ts, (int)ms,
               kLevels[static_cast<int>(lvl)].tag, thread_tag());
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fputc('\n', stderr);
}

} // namespace scanlink
