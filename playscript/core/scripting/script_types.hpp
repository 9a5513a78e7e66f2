#pragma once

#include "script_value.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace playscript::scripting {

enum class ScriptErrorKind : std::uint8_t {
    None = 0,
    Load,       // syntax error or top-level runtime error while loading
    Call,       // missing/non-callable entry point or guest runtime error
    Marshal,    // guest value has no host representation
};

inline const char* script_error_kind_name(ScriptErrorKind kind) {
    switch (kind) {
        case ScriptErrorKind::None: return "none";
        case ScriptErrorKind::Load: return "LoadError";
        case ScriptErrorKind::Call: return "CallError";
        case ScriptErrorKind::Marshal: return "MarshalError";
        default: return "unknown";
    }
}

// Script execution result
struct ScriptResult {
    bool success{false};
    ScriptErrorKind kind{ScriptErrorKind::None};
    std::string error;

    static ScriptResult ok() { return {true, ScriptErrorKind::None, ""}; }
    static ScriptResult fail(const std::string& err, ScriptErrorKind kind = ScriptErrorKind::Call) {
        return {false, kind, err};
    }

    explicit operator bool() const { return success; }
};

// Result of calling into the guest: status plus the (single) marshaled return value.
struct CallResult {
    bool success{false};
    ScriptErrorKind kind{ScriptErrorKind::None};
    std::string error;
    ScriptValue value;

    static CallResult ok(ScriptValue v) { return {true, ScriptErrorKind::None, "", std::move(v)}; }
    static CallResult fail(const std::string& err, ScriptErrorKind kind = ScriptErrorKind::Call) {
        return {false, kind, err, ScriptValue{}};
    }

    explicit operator bool() const { return success; }
};

// Thrown only when a guest heap cannot be created at all.
class EngineFatalError : public std::runtime_error {
public:
    explicit EngineFatalError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace playscript::scripting
