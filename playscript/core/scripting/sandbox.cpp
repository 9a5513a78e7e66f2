#include "sandbox.hpp"

#include <sol/sol.hpp>

#include <regex>
#include <sstream>

namespace playscript::scripting {

namespace {

// Everything LuaState strips from a sandboxed state, plus the Lua 5.1
// leftovers LuaJIT still ships.
const std::vector<std::string> kForbiddenFunctions = {
    "os", "io", "debug", "package", "require", "module",
    "load", "loadfile", "loadstring", "dofile",
    "collectgarbage", "gcinfo", "newproxy",
    "rawget", "rawset", "rawequal", "setmetatable",
    "getfenv", "setfenv",
};

const char* const kRequiredHooks[] = {"init", "start", "onInput", "getNextChallenge"};

// "Game.load(" and "obj:debug(" are fields, only bare names count.
bool uses_global(const std::string& script, const std::string& name) {
    const std::regex re("(^|[^.:\\w])" + name + "\\s*[.:(]");
    return std::regex_search(script, re);
}

// Either `function Game.hook(` / `function Game:hook(` or `hook = function`
// inside a table constructor.
bool defines_hook(const std::string& script, const std::string& moduleName, const std::string& hook) {
    const std::regex byName("function\\s+" + moduleName + "\\s*[.:]\\s*" + hook + "\\s*\\(");
    const std::regex byField("(^|[^.:\\w])" + hook + "\\s*=\\s*function\\b");
    return std::regex_search(script, byName) || std::regex_search(script, byField);
}

bool has_bytecode_marker(const std::string& script) {
    return script.find("\x1bLua") != std::string::npos ||
           script.find("\\27Lua") != std::string::npos ||
           script.find("\\x1b") != std::string::npos;
}

bool has_unbounded_loop(const std::string& script) {
    static const std::regex re("while\\s*\\(?\\s*true\\s*\\)?\\s*do|until\\s*\\(?\\s*false\\b");
    return std::regex_search(script, re);
}

std::string join_print_args(sol::variadic_args va, sol::this_state ts) {
    sol::state_view lua(ts);
    sol::protected_function tostring = lua["tostring"];

    std::ostringstream line;
    bool first = true;
    for (auto arg : va) {
        if (!first) line << '\t';
        first = false;

        if (!tostring.valid()) continue;
        sol::protected_function_result text = tostring(arg);
        if (text.valid() && text.get_type() == sol::type::string) {
            line << text.get<std::string>();
        }
    }
    return line.str();
}

} // namespace

SandboxConfig SandboxConfig::default_for_games() {
    SandboxConfig cfg;
    cfg.maxMemoryMB = 32;
    cfg.maxInstructionsPerCall = 5000000;
    cfg.maxExecutionTimeSec = 2.0;
    return cfg;
}

ScriptLimits SandboxConfig::to_script_limits() const {
    ScriptLimits limits;
    limits.maxMemoryBytes = maxMemoryMB * 1024 * 1024;
    limits.maxInstructions = maxInstructionsPerCall;
    limits.maxExecutionTimeSec = maxExecutionTimeSec;
    return limits;
}

void ValidationResult::error(std::string message) {
    valid = false;
    errors.push_back(std::move(message));
}

void ValidationResult::warn(std::string message) {
    warnings.push_back(std::move(message));
}

void ValidationResult::merge(const ValidationResult& other) {
    valid = valid && other.valid;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
}

ValidationResult Sandbox::validate_script(const std::string& script, const std::string& moduleName) {
    ValidationResult result;

    auto scratch = create_sandboxed_state();
    if (!scratch) {
        result.error("Failed to create Lua state");
        return result;
    }

    // load() compiles the chunk without running it.
    auto compiled = scratch->load(script, "validate");
    if (!compiled) {
        result.error(compiled.error);
        return result;
    }

    result.merge(check_forbidden_calls(script));
    result.merge(check_lifecycle_hooks(script, moduleName));
    return result;
}

ValidationResult Sandbox::check_forbidden_calls(const std::string& script) {
    ValidationResult result;

    for (const auto& name : kForbiddenFunctions) {
        if (uses_global(script, name)) {
            result.error("Forbidden function/module used: " + name);
        }
    }

    if (has_bytecode_marker(script)) {
        result.error("Potential bytecode detected; only source text is loaded");
    }

    if (has_unbounded_loop(script)) {
        result.warn("Infinite loop pattern; the instruction budget will cut the call short");
    }

    return result;
}

ValidationResult Sandbox::check_lifecycle_hooks(const std::string& script, const std::string& moduleName) {
    ValidationResult result;

    if (script.find(moduleName) == std::string::npos) {
        result.warn("Script never mentions the " + moduleName + " table");
        return result;
    }

    for (const char* hook : kRequiredHooks) {
        if (!defines_hook(script, moduleName, hook)) {
            result.warn("No definition found for " + moduleName + "." + hook);
        }
    }

    return result;
}

std::unique_ptr<LuaState> Sandbox::create(const SandboxConfig& config) {
    auto state = create_sandboxed_state(config.to_script_limits());
    if (!state) {
        return nullptr;
    }

    if (config.printHandler) {
        auto handler = config.printHandler;
        state->state()["print"] = [handler](sol::variadic_args va, sol::this_state ts) {
            handler(join_print_args(va, ts));
        };
    }

    return state;
}

const std::vector<std::string>& Sandbox::forbidden_functions() {
    return kForbiddenFunctions;
}

} // namespace playscript::scripting
