#include "Log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

// ---- one lock for every line (avoid interleaved prints from multiple threads) ----
static std::mutex g_log_mtx;
static LogSink g_sink;
static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

static std::string utc_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms  = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t t = system_clock::to_time_t(now);

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

void set_log_level(LogLevel lvl) {
    g_level = static_cast<int>(lvl);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

LogLevel parse_log_level(const std::string& s) {
    std::string lc = s;
    for (auto& c : lc) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lc == "debug") return LogLevel::Debug;
    if (lc == "warn" || lc == "warning") return LogLevel::Warn;
    if (lc == "error") return LogLevel::Error;
    return LogLevel::Info;
}

const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_sink = std::move(sink);
}

void log_msg(LogLevel lvl, const std::string& tag, const std::string& msg) {
    if (lvl < log_level()) return;

    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_sink) {
        g_sink(lvl, tag, msg);
        return;
    }

    std::ostream& os = (lvl >= LogLevel::Warn) ? std::cerr : std::cout;
    os << utc_timestamp() << ' ' << log_level_name(lvl)
       << " [" << tag << "] " << msg << '\n';
}
