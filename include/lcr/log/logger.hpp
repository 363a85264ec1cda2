#pragma once

#include <atomic>
#include <mutex>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <thread>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Unknown names map to Info
[[nodiscard]] inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]] bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] [" << std::this_thread::get_id() << "] " << msg;
        if (color) os << "\033[0m"; // reset
        os << '\n';
        if (lvl >= Level::Error) os.flush();
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(false)
    {}

    // Human-readable severity names
    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
        }
        return "?????";
    }

    // ANSI color mappings
    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
        }
        return "\033[0m";
    }

    // Timestamp with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[64];
        const std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + len, sizeof(buf) - len, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
// The level check runs before the message is formatted.
// ---------------------------------------------------------
#define FR_LOG_LEVEL(lvl, msg)                                          \
    do {                                                                \
        if (::lcr::log::Logger::instance().enabled((lvl))) {            \
            ::lcr::log::LogStream((lvl)) << msg;                        \
        }                                                               \
    } while (0)

#define FR_TRACE(msg)  FR_LOG_LEVEL(::lcr::log::Level::Trace, msg)
#define FR_DEBUG(msg)  FR_LOG_LEVEL(::lcr::log::Level::Debug, msg)
#define FR_INFO(msg)   FR_LOG_LEVEL(::lcr::log::Level::Info,  msg)
#define FR_WARN(msg)   FR_LOG_LEVEL(::lcr::log::Level::Warn,  msg)
#define FR_ERROR(msg)  FR_LOG_LEVEL(::lcr::log::Level::Error, msg)
#define FR_FATAL(msg)  FR_LOG_LEVEL(::lcr::log::Level::Fatal, msg)
