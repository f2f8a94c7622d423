#pragma once
#include <functional>
#include <sstream>
#include <string>

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

// Receives every line that passes the level filter.
// Default sink writes "<ts> LEVEL [tag] msg" to stdout (Warn/Error to stderr).
using LogSink = std::function<void(LogLevel, const std::string& tag, const std::string& msg)>;

void set_log_level(LogLevel lvl);
LogLevel log_level();

// "debug" / "info" / "warn" / "error" (case-insensitive), anything else -> Info
LogLevel parse_log_level(const std::string& s);
const char* log_level_name(LogLevel lvl);

// Pass an empty function to restore the default sink
void set_log_sink(LogSink sink);

void log_msg(LogLevel lvl, const std::string& tag, const std::string& msg);

// One log line, emitted when the temporary goes out of scope:
//   LogLine(LogLevel::Info, "Solver") << "sent " << n << " responses";
// Nothing is formatted below the current level.
class LogLine {
public:
    LogLine(LogLevel lvl, const char* tag)
        : lvl_(lvl), tag_(tag), on_(lvl >= log_level())
    {}

    ~LogLine() {
        if (on_) log_msg(lvl_, tag_, oss_.str());
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& v) {
        if (on_) oss_ << v;
        return *this;
    }

private:
    LogLevel lvl_;
    const char* tag_;
    bool on_;
    std::ostringstream oss_;
};
