#pragma once

#include "lua_state.hpp"

#include <functional>
#include <string>
#include <vector>

namespace playscript::scripting {

// Per-game resource limits and the host side of guest print().
struct SandboxConfig {
    std::size_t maxMemoryMB{64};
    std::size_t maxInstructionsPerCall{10000000};
    double maxExecutionTimeSec{5.0};

    // Receives one tab-joined line per print() call. When unset, output
    // is dropped.
    std::function<void(const std::string&)> printHandler;

    // 32 MB, 5M instructions and 2 s per call.
    static SandboxConfig default_for_games();

    ScriptLimits to_script_limits() const;
};

// Outcome of a static script check. Errors make it invalid, warnings do not.
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void error(std::string message);
    void warn(std::string message);
    void merge(const ValidationResult& other);

    explicit operator bool() const { return valid; }
};

class Sandbox {
public:
    // Syntax check in a throwaway state, then the static checks below.
    // Nothing in the script is run.
    static ValidationResult validate_script(const std::string& script,
                                            const std::string& moduleName = "Game");

    // Global use of stripped libraries, embedded bytecode, and loops with
    // no visible exit (warning).
    static ValidationResult check_forbidden_calls(const std::string& script);

    // Warns when the module table or one of the required hooks
    // (init, start, onInput, getNextChallenge) never appears.
    static ValidationResult check_lifecycle_hooks(const std::string& script,
                                                  const std::string& moduleName = "Game");

    // Fresh restricted state with the config's limits and print routing.
    // Returns nullptr only if no guest heap could be allocated.
    static std::unique_ptr<LuaState> create(const SandboxConfig& config);

    static const std::vector<std::string>& forbidden_functions();
};

} // namespace playscript::scripting
