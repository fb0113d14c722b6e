#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace rgtp {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mtx_);
  level_ = lvl;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return level_;
}

void Logger::set_sink(Sink sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = std::move(sink);
}

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
  std::lock_guard<std::mutex> lk(mtx_);
  if (lvl < level_ || lvl == LogLevel::OFF)
    return;
  char msg[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);
  if (sink_) {
    sink_(lvl, msg);
    return;
  }
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::fprintf(stderr, "%s [%s] %s\n", ts, level_str(lvl), msg);
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  std::string v(s);
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
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
  else if (v == "off")
    out = LogLevel::OFF;
  else
    return false;
  return true;
}

} // namespace rgtp
