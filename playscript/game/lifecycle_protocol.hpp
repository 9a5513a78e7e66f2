#pragma once

#include "game_state.hpp"

#include <playscript/core/scripting/lua_state.hpp>
#include <playscript/core/scripting/script_types.hpp>

#include <string>
#include <utility>
#include <vector>

namespace playscript::game {

using scripting::ScriptErrorKind;

// Entry points a game script defines under its module table.
namespace hooks {
constexpr const char* kInit = "init";
constexpr const char* kStart = "start";
constexpr const char* kOnInput = "onInput";
constexpr const char* kGetNextChallenge = "getNextChallenge";
constexpr const char* kGetHint = "getHint";
constexpr const char* kTick = "tick";
constexpr const char* kGetResults = "getResults";
} // namespace hooks

// Typed outcome of one lifecycle call.
template <typename T>
struct ProtocolResult {
    bool success{false};
    ScriptErrorKind kind{ScriptErrorKind::None};
    std::string error;
    T value{};

    static ProtocolResult ok(T v) { return {true, ScriptErrorKind::None, "", std::move(v)}; }
    static ProtocolResult fail(const std::string& err, ScriptErrorKind kind) {
        return {false, kind, err, T{}};
    }

    explicit operator bool() const { return success; }
};

// Typed view of the lifecycle contract over one loaded LuaState.
//
// Calls are resolved by dotted path ("Game.onInput") at call time, so a
// missing hook surfaces as a CallError rather than at load. Return values
// that do not decode to the expected shape come back as MarshalError.
// No fallbacks are applied here; that is GameRunner's job.
class GameProtocol {
public:
    GameProtocol(scripting::LuaState& lua, std::string moduleName);

    const std::string& module_name() const { return moduleName_; }

    // "<module>.<hook>"
    std::string path(const char* hook) const;

    bool defines(const std::string& hook) const;

    ProtocolResult<GameState> init();
    ProtocolResult<GameState> start(const GameState& state);
    ProtocolResult<InputResult> on_input(const GameState& state, const std::string& input);
    ProtocolResult<GameState> get_next_challenge(const GameState& state);
    ProtocolResult<std::string> get_hint(const GameState& state);
    ProtocolResult<GameState> tick(const GameState& state, double deltaSec);
    ProtocolResult<ScriptValue::Record> get_results(const GameState& state);

private:
    ProtocolResult<GameState> call_state(const char* hook, const std::vector<ScriptValue>& args);

    scripting::LuaState& lua_;
    std::string moduleName_;
};

// Decoding rules shared with tests.
//
// onInput accepts {state = {...}, correct = b, points = n} or a bare state
// record carrying `correct`/`points` alongside the state fields.
ProtocolResult<InputResult> decode_input_result(const ScriptValue& value);

} // namespace playscript::game
