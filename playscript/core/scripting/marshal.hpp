#pragma once

// Value marshaling between ScriptValue (host) and Lua (guest).
//
// Host -> guest:
//   nil/bool/integer/number/string map to the matching Lua type. Strings are
//   pushed byte-for-byte (std::string already holds UTF-8), so multi-byte
//   characters survive unchanged. Records become string-keyed tables,
//   sequences become tables keyed 1..N.
//
// Guest -> host (tables):
//   - no keys at all             -> empty Record
//   - integer keys exactly 1..N  -> Sequence of N elements
//   - anything else              -> Record; number and boolean keys are
//                                   stored under their string form
//   Function, coroutine and userdata values, or table/function keys, have no
//   host form and fail with a marshal error.
//
// Known limitation: an empty Sequence comes back as an empty Record.

#include "script_value.hpp"

#include <sol/sol.hpp>

#include <string>

namespace playscript::scripting {

// Deeper nesting (or a cycle) is rejected rather than recursed into.
constexpr int kMaxMarshalDepth = 64;

struct MarshalResult {
    bool success{false};
    std::string error;
    ScriptValue value;

    static MarshalResult ok(ScriptValue v) { return {true, "", std::move(v)}; }
    static MarshalResult fail(const std::string& err) { return {false, err, ScriptValue{}}; }

    explicit operator bool() const { return success; }
};

sol::object to_guest(sol::state_view lua, const ScriptValue& value);

MarshalResult to_host(const sol::object& value);

// String form used for non-string keys when a table becomes a Record.
std::string number_key_string(double key);

} // namespace playscript::scripting
