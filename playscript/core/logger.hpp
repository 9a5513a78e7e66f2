#pragma once

#include <cstdarg>
#include <cstdio>
#include <string>

namespace playscript::core {

enum class LogLevel : int {
    Trace = 0,
    Debug,
    Info,
    Warning,
    Error,
    None,
};

struct LoggingConfig {
    bool enabled{true};
    LogLevel level{LogLevel::Info};
    std::string file{};

    // Per-tag switches; unknown tags pass whenever logging is enabled.
    struct Tags {
        bool script{true};
        bool runner{true};
        bool loop{true};
    } tags{};
};

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, tag filter, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    bool enabled(LogLevel level, const char* tag) const;

    void logf(LogLevel level, const char* tag, const char* fmt, ...);
    void vlogf(LogLevel level, const char* tag, const char* fmt, va_list args);

    const LoggingConfig& config() const { return cfg_; }

private:
    Logger() = default;

    LoggingConfig cfg_{};
    std::FILE* file_{nullptr};
};

const char* log_level_name(LogLevel level);

// printf-style entry point used across the project. Call it qualified
// (core::logf) so it never resolves to the C math logf.
inline void logf(LogLevel level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    Logger::instance().vlogf(level, tag, fmt, args);
    va_end(args);
}

} // namespace playscript::core
