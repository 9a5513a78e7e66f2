#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace playscript::core {

namespace {

std::string strip_quotes(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

} // namespace

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    try {
        const std::string s = trim(v);
        size_t idx = 0;
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::exception&) {
        return default_value;
    }
}

std::size_t Config::parse_size(const std::string& v, std::size_t default_value) {
    try {
        const std::string s = trim(v);
        if (s.empty() || s.front() == '-') return default_value;
        size_t idx = 0;
        unsigned long long out = std::stoull(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return static_cast<std::size_t>(out);
    } catch (const std::exception&) {
        return default_value;
    }
}

double Config::parse_double(const std::string& v, double default_value) {
    try {
        const std::string s = trim(v);
        size_t idx = 0;
        double out = std::stod(s, &idx);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::exception&) {
        return default_value;
    }
}

LogLevel Config::log_level_from_string(const std::string& v, LogLevel default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, LogLevel> map = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warning}, {"warn", LogLevel::Warning},
        {"error", LogLevel::Error},
        {"none", LogLevel::None}, {"off", LogLevel::None},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    const int n = parse_int(s, -1);
    if (n >= static_cast<int>(LogLevel::Trace) && n <= static_cast<int>(LogLevel::None)) {
        return static_cast<LogLevel>(n);
    }
    return default_value;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "logging") {
        auto& lg = config_.logging;
        if (k == "enabled") lg.enabled = parse_bool(v, lg.enabled);
        else if (k == "level") lg.level = log_level_from_string(v, lg.level);
        else if (k == "file") lg.file = v;
        else if (k == "script") lg.tags.script = parse_bool(v, lg.tags.script);
        else if (k == "runner") lg.tags.runner = parse_bool(v, lg.tags.runner);
        else if (k == "loop") lg.tags.loop = parse_bool(v, lg.tags.loop);
        return;
    }

    if (sec == "sandbox") {
        auto& sb = config_.sandbox;
        if (k == "max_memory_mb") sb.max_memory_mb = parse_size(v, sb.max_memory_mb);
        else if (k == "max_instructions") sb.max_instructions = parse_size(v, sb.max_instructions);
        else if (k == "max_execution_time_sec") {
            const double secs = parse_double(v, sb.max_execution_time_sec);
            if (secs >= 0.0) sb.max_execution_time_sec = secs;
        }
        return;
    }

    if (sec == "round") {
        auto& rd = config_.round;
        if (k == "default_duration") {
            const int d = parse_int(v, rd.default_duration);
            if (d > 0) rd.default_duration = d;
        }
        else if (k == "max_wrong_guesses") {
            const int m = parse_int(v, rd.max_wrong_guesses);
            if (m >= 0) rd.max_wrong_guesses = m;
        }
        else if (k == "advance_after_start") rd.advance_after_start = parse_bool(v, rd.advance_after_start);
        else if (k == "forward_ticks") rd.forward_ticks = parse_bool(v, rd.forward_ticks);
        return;
    }
}

void Config::load_from_stream(std::istream& in) {
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;) - simplest approach: cut at first occurrence.
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    load_from_stream(in);
    loaded_from_path_ = path;
    return true;
}

bool Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    load_from_stream(in);
    return true;
}

scripting::SandboxConfig Config::sandbox_config() const {
    scripting::SandboxConfig cfg;
    cfg.maxMemoryMB = config_.sandbox.max_memory_mb;
    cfg.maxInstructionsPerCall = config_.sandbox.max_instructions;
    cfg.maxExecutionTimeSec = config_.sandbox.max_execution_time_sec;
    return cfg;
}

} // namespace playscript::core
