#pragma once
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>

namespace rgtp {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const;
    // An empty sink restores the stderr writer.
    void set_sink(Sink sink);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    mutable std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    Sink sink_;
    const char* level_str(LogLevel lvl);
};

bool parse_log_level(const std::string& s, LogLevel& out);

} // namespace rgtp
