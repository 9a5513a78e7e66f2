#include "game_runner.hpp"

#include <playscript/core/config.hpp>
#include <playscript/core/logger.hpp>

namespace playscript::game {

RunnerOptions RunnerOptions::from_config(const core::Config& config) {
    RunnerOptions opts;
    opts.sandbox = config.sandbox_config();
    opts.defaultDurationSec = config.round().default_duration;
    opts.defaultMaxWrongGuesses = config.round().max_wrong_guesses;
    return opts;
}

std::unique_ptr<GameRunner> create_runner(const std::string& source, const RunnerOptions& options) {
    scripting::SandboxConfig sandbox = options.sandbox;
    if (!sandbox.printHandler) {
        sandbox.printHandler = [](const std::string& msg) {
            core::logf(core::LogLevel::Info, "script", "%s", msg.c_str());
        };
    }

    auto lua = scripting::Sandbox::create(sandbox);
    if (!lua) {
        throw scripting::EngineFatalError("Failed to create sandboxed Lua state");
    }

    auto result = lua->execute(source, options.chunkName, options.moduleName);
    if (!result) {
        core::logf(core::LogLevel::Warning, "runner", "%s: %s",
                   scripting::script_error_kind_name(result.kind), result.error.c_str());
        return nullptr;
    }

    if (!lua->has_function(options.moduleName + "." + hooks::kInit)) {
        // Not fatal: init falls back to the built-in state.
        core::logf(core::LogLevel::Debug, "runner", "script defines no %s.%s",
                   options.moduleName.c_str(), hooks::kInit);
    }

    return std::unique_ptr<GameRunner>(new GameRunner(std::move(lua), options));
}

GameRunner::GameRunner(std::unique_ptr<scripting::LuaState> lua, RunnerOptions options)
    : lua_(std::move(lua)), options_(std::move(options)) {
    protocol_ = std::make_unique<GameProtocol>(*lua_, options_.moduleName);
}

GameRunner::~GameRunner() {
    destroy();
}

void GameRunner::destroy() {
    if (!lua_) return;

    protocol_.reset();
    lua_.reset();
    core::logf(core::LogLevel::Debug, "runner", "runner destroyed");
}

bool GameRunner::usable(const char* hook) {
    if (lua_) return true;

    lastError_ = std::string("runner destroyed; ") + hook + " not called";
    lastErrorKind_ = ScriptErrorKind::Call;
    core::logf(core::LogLevel::Warning, "runner", "%s", lastError_.c_str());
    return false;
}

template <typename T>
void GameRunner::note_failure(const char* hook, const ProtocolResult<T>& r) {
    lastError_ = r.error;
    lastErrorKind_ = r.kind;
    core::logf(core::LogLevel::Warning, "runner", "%s failed (%s): %s",
               hook, scripting::script_error_kind_name(r.kind), r.error.c_str());
}

GameState GameRunner::init() {
    if (!usable(hooks::kInit)) {
        return default_game_state(options_.defaultDurationSec, options_.defaultMaxWrongGuesses);
    }

    auto r = protocol_->init();
    if (!r) {
        note_failure(hooks::kInit, r);
        return default_game_state(options_.defaultDurationSec, options_.defaultMaxWrongGuesses);
    }
    return std::move(r.value);
}

GameState GameRunner::start(const GameState& state) {
    if (!usable(hooks::kStart)) return state;

    auto r = protocol_->start(state);
    if (!r) {
        note_failure(hooks::kStart, r);
        return state;
    }
    return std::move(r.value);
}

InputResult GameRunner::on_input(const GameState& state, const std::string& input) {
    InputResult closed{state, false, 0};
    if (!usable(hooks::kOnInput)) return closed;

    auto r = protocol_->on_input(state, input);
    if (!r) {
        note_failure(hooks::kOnInput, r);
        return closed;
    }
    return std::move(r.value);
}

GameState GameRunner::get_next_challenge(const GameState& state) {
    if (!usable(hooks::kGetNextChallenge)) return state;

    auto r = protocol_->get_next_challenge(state);
    if (!r) {
        note_failure(hooks::kGetNextChallenge, r);
        return state;
    }
    return std::move(r.value);
}

std::string GameRunner::get_hint(const GameState& state) {
    if (!usable(hooks::kGetHint)) return "";

    // Optional hook: absence is not an error.
    if (!protocol_->defines(hooks::kGetHint)) return "";

    auto r = protocol_->get_hint(state);
    if (!r) {
        note_failure(hooks::kGetHint, r);
        return "";
    }
    return std::move(r.value);
}

GameState GameRunner::tick(const GameState& state, double deltaSec) {
    if (!usable(hooks::kTick)) return state;
    if (!protocol_->defines(hooks::kTick)) return state;

    auto r = protocol_->tick(state, deltaSec);
    if (!r) {
        note_failure(hooks::kTick, r);
        return state;
    }
    return std::move(r.value);
}

ScriptValue::Record GameRunner::get_results(const GameState& state) {
    ScriptValue::Record fallback{{state_keys::kScore, ScriptValue(state.score)}};
    if (!usable(hooks::kGetResults)) return fallback;
    if (!protocol_->defines(hooks::kGetResults)) return fallback;

    auto r = protocol_->get_results(state);
    if (!r) {
        note_failure(hooks::kGetResults, r);
        return fallback;
    }
    return std::move(r.value);
}

bool GameRunner::has_hook(const std::string& name) const {
    if (!protocol_) return false;
    return protocol_->defines(name);
}

std::size_t GameRunner::memory_used() const {
    return lua_ ? lua_->memory_used() : 0;
}

} // namespace playscript::game
