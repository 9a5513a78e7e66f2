#pragma once

#include "logger.hpp"
#include "scripting/sandbox.hpp"

#include <istream>
#include <string>

namespace playscript::core {

struct SandboxSettings {
    std::size_t max_memory_mb{32};
    std::size_t max_instructions{5000000};
    double max_execution_time_sec{2.0};
};

struct RoundSettings {
    int default_duration{60};
    int max_wrong_guesses{6};

    // Solo play advances to the first challenge right after start().
    bool advance_after_start{true};

    // Forward the host's once-per-second countdown to Game.tick when defined.
    bool forward_ticks{false};
};

struct AppConfig {
    LoggingConfig logging{};
    SandboxSettings sandbox{};
    RoundSettings round{};
};

// INI-style configuration:
//
//   [logging]  enabled, level, file, script, runner, loop
//   [sandbox]  max_memory_mb, max_instructions, max_execution_time_sec
//   [round]    default_duration, max_wrong_guesses, advance_after_start, forward_ticks
//
// Unknown keys are ignored; malformed values keep the previous value.
class Config {
public:
    Config() = default;

    bool load_from_file(const std::string& path);
    bool load_from_string(const std::string& text);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const AppConfig& get() const { return config_; }

    const LoggingConfig& logging() const { return config_.logging; }
    const SandboxSettings& sandbox() const { return config_.sandbox; }
    const RoundSettings& round() const { return config_.round; }

    scripting::SandboxConfig sandbox_config() const;

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);

private:
    AppConfig config_{};

    std::string loaded_from_path_{};

    void load_from_stream(std::istream& in);

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    static std::size_t parse_size(const std::string& v, std::size_t default_value);
    static double parse_double(const std::string& v, double default_value);

    static LogLevel log_level_from_string(const std::string& v, LogLevel default_value);
};

} // namespace playscript::core
