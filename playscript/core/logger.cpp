#include "logger.hpp"

#include <chrono>
#include <cstdarg>
#include <cstring>

namespace playscript::core {

namespace {

const auto g_start = std::chrono::steady_clock::now();

double seconds_since_start() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - g_start).count();
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None: return "NONE";
        default: return "INFO";
    }
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const LoggingConfig& cfg) {
    shutdown();

    cfg_ = cfg;

    if (!cfg_.enabled) {
        return;
    }

    if (!cfg_.file.empty()) {
        file_ = std::fopen(cfg_.file.c_str(), "a");
        if (!file_) {
            std::fprintf(stderr, "[%.3f][WARN][log] cannot open log file %s\n",
                         seconds_since_start(), cfg_.file.c_str());
        }
    }
}

void Logger::shutdown() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

bool Logger::enabled(LogLevel level, const char* tag) const {
    if (!cfg_.enabled) return false;
    if (level == LogLevel::None) return false;
    if (static_cast<int>(level) < static_cast<int>(cfg_.level)) return false;
    if (!tag) return true;

    // Tags used by the library: script, runner, loop
    if (std::strcmp(tag, "script") == 0) return cfg_.tags.script;
    if (std::strcmp(tag, "runner") == 0) return cfg_.tags.runner;
    if (std::strcmp(tag, "loop") == 0) return cfg_.tags.loop;

    // Unknown tag: keep it if logging is enabled.
    return true;
}

void Logger::logf(LogLevel level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

void Logger::vlogf(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!enabled(level, tag)) return;

    const double t = seconds_since_start();
    const char* level_str = log_level_name(level);
    const char* tag_str = tag ? tag : "-";

    if (file_) {
        va_list args_copy;
        va_copy(args_copy, args);

        std::fprintf(file_, "[%.3f][%s][%s] ", t, level_str, tag_str);
        std::vfprintf(file_, fmt, args_copy);
        std::fputc('\n', file_);
        std::fflush(file_);

        va_end(args_copy);
    }

    va_list args_err;
    va_copy(args_err, args);
    std::fprintf(stderr, "[%.3f][%s][%s] ", t, level_str, tag_str);
    std::vfprintf(stderr, fmt, args_err);
    std::fputc('\n', stderr);
    va_end(args_err);
}

} // namespace playscript::core
