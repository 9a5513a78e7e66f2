#include "lifecycle_protocol.hpp"

#include <climits>
#include <cmath>

namespace playscript::game {

namespace {

constexpr const char* kCorrectKey = "correct";
constexpr const char* kPointsKey = "points";
constexpr const char* kStateKey = "state";

template <typename T>
ProtocolResult<T> forward_failure(const scripting::CallResult& r) {
    return ProtocolResult<T>::fail(r.error, r.kind);
}

int points_from(const ScriptValue* v) {
    if (!v || !v->is_number()) return 0;

    const double p = v->as_number();
    if (std::isnan(p) || p <= 0.0) return 0;
    if (p >= static_cast<double>(INT_MAX)) return INT_MAX;
    return static_cast<int>(p);
}

} // namespace

ProtocolResult<InputResult> decode_input_result(const ScriptValue& value) {
    if (!value.is_record()) {
        return ProtocolResult<InputResult>::fail(
            std::string("onInput returned ") + value.type_name() + ", expected a table",
            ScriptErrorKind::Marshal);
    }

    const auto& rec = value.as_record();
    InputResult result;

    const ScriptValue* correct = value.find(kCorrectKey);
    result.correct = correct && correct->is_boolean() && correct->as_bool();
    result.points = points_from(value.find(kPointsKey));

    const ScriptValue* nested = value.find(kStateKey);
    if (nested && nested->is_record()) {
        auto state = GameState::from_value(*nested);
        result.state = std::move(*state);
    } else {
        // Bare state: the whole record is the new state, minus the verdict.
        ScriptValue::Record stateRec = rec;
        stateRec.erase(kCorrectKey);
        stateRec.erase(kPointsKey);
        auto state = GameState::from_value(ScriptValue(std::move(stateRec)));
        result.state = std::move(*state);
    }

    return ProtocolResult<InputResult>::ok(std::move(result));
}

GameProtocol::GameProtocol(scripting::LuaState& lua, std::string moduleName)
    : lua_(lua), moduleName_(std::move(moduleName)) {}

std::string GameProtocol::path(const char* hook) const {
    return moduleName_ + "." + hook;
}

bool GameProtocol::defines(const std::string& hook) const {
    return lua_.has_function(moduleName_ + "." + hook);
}

ProtocolResult<GameState> GameProtocol::call_state(const char* hook, const std::vector<ScriptValue>& args) {
    auto r = lua_.call(path(hook), args);
    if (!r) {
        return forward_failure<GameState>(r);
    }

    auto state = GameState::from_value(r.value);
    if (!state) {
        return ProtocolResult<GameState>::fail(
            path(hook) + ": returned " + r.value.type_name() + ", expected a state table",
            ScriptErrorKind::Marshal);
    }
    return ProtocolResult<GameState>::ok(std::move(*state));
}

ProtocolResult<GameState> GameProtocol::init() {
    return call_state(hooks::kInit, {});
}

ProtocolResult<GameState> GameProtocol::start(const GameState& state) {
    return call_state(hooks::kStart, {state.to_value()});
}

ProtocolResult<InputResult> GameProtocol::on_input(const GameState& state, const std::string& input) {
    auto r = lua_.call(path(hooks::kOnInput), {state.to_value(), ScriptValue(input)});
    if (!r) {
        return forward_failure<InputResult>(r);
    }

    auto decoded = decode_input_result(r.value);
    if (!decoded) {
        decoded.error = path(hooks::kOnInput) + ": " + decoded.error;
    }
    return decoded;
}

ProtocolResult<GameState> GameProtocol::get_next_challenge(const GameState& state) {
    return call_state(hooks::kGetNextChallenge, {state.to_value()});
}

ProtocolResult<std::string> GameProtocol::get_hint(const GameState& state) {
    auto r = lua_.call(path(hooks::kGetHint), {state.to_value()});
    if (!r) {
        return forward_failure<std::string>(r);
    }

    if (r.value.is_nil()) {
        return ProtocolResult<std::string>::ok("");
    }
    if (r.value.is_string()) {
        return ProtocolResult<std::string>::ok(r.value.as_string());
    }
    return ProtocolResult<std::string>::fail(
        path(hooks::kGetHint) + ": returned " + r.value.type_name() + ", expected a string",
        ScriptErrorKind::Marshal);
}

ProtocolResult<GameState> GameProtocol::tick(const GameState& state, double deltaSec) {
    return call_state(hooks::kTick, {state.to_value(), ScriptValue(deltaSec)});
}

ProtocolResult<ScriptValue::Record> GameProtocol::get_results(const GameState& state) {
    auto r = lua_.call(path(hooks::kGetResults), {state.to_value()});
    if (!r) {
        return forward_failure<ScriptValue::Record>(r);
    }

    if (!r.value.is_record()) {
        return ProtocolResult<ScriptValue::Record>::fail(
            path(hooks::kGetResults) + ": returned " + r.value.type_name() + ", expected a table",
            ScriptErrorKind::Marshal);
    }
    return ProtocolResult<ScriptValue::Record>::ok(r.value.as_record());
}

} // namespace playscript::game
