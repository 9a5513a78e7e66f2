#pragma once

#include "game_state.hpp"
#include "lifecycle_protocol.hpp"

#include <playscript/core/scripting/lua_state.hpp>
#include <playscript/core/scripting/sandbox.hpp>

#include <memory>
#include <string>

namespace playscript::core {
class Config;
}

namespace playscript::game {

struct RunnerOptions {
    scripting::SandboxConfig sandbox{scripting::SandboxConfig::default_for_games()};

    // Global table holding the lifecycle functions
    std::string moduleName{"Game"};

    // Used for the built-in state when init() is unusable
    int defaultDurationSec{kDefaultDurationSec};
    int defaultMaxWrongGuesses{kDefaultMaxWrongGuesses};

    // Shown in guest error messages ("logic.lua:3: ...")
    std::string chunkName{"logic.lua"};

    static RunnerOptions from_config(const core::Config& config);
};

class GameRunner;

// Creates a sandboxed engine and loads the script. Returns nullptr when the
// script fails to load (syntax error or error at top level). Throws
// scripting::EngineFatalError only when no guest heap can be allocated.
std::unique_ptr<GameRunner> create_runner(const std::string& source, const RunnerOptions& options = {});

// Host-side facade over one loaded game script.
//
// Every method returns a usable value: guest failures are logged, remembered
// in last_error() and replaced by the method's fallback. After destroy() all
// methods return their fallbacks without touching the guest.
class GameRunner {
public:
    ~GameRunner();

    GameRunner(const GameRunner&) = delete;
    GameRunner& operator=(const GameRunner&) = delete;

    // Falls back to default_game_state() when init fails or returns a non-table.
    GameState init();

    // Falls back to the input state.
    GameState start(const GameState& state);

    // Fails closed: {state, false, 0}.
    InputResult on_input(const GameState& state, const std::string& input);

    // Falls back to the input state.
    GameState get_next_challenge(const GameState& state);

    // "" when getHint is missing or fails.
    std::string get_hint(const GameState& state);

    // Optional hook; falls back to the input state.
    GameState tick(const GameState& state, double deltaSec);

    // Optional hook; falls back to {score = state.score}.
    ScriptValue::Record get_results(const GameState& state);

    bool has_hook(const std::string& name) const;

    // Releases the guest heap. Safe to call more than once.
    void destroy();
    bool destroyed() const { return !lua_; }

    const std::string& last_error() const { return lastError_; }
    ScriptErrorKind last_error_kind() const { return lastErrorKind_; }

    const RunnerOptions& options() const { return options_; }

    std::size_t memory_used() const;

private:
    friend std::unique_ptr<GameRunner> create_runner(const std::string& source, const RunnerOptions& options);

    GameRunner(std::unique_ptr<scripting::LuaState> lua, RunnerOptions options);

    bool usable(const char* hook);

    template <typename T>
    void note_failure(const char* hook, const ProtocolResult<T>& r);

    std::unique_ptr<scripting::LuaState> lua_;
    std::unique_ptr<GameProtocol> protocol_;
    RunnerOptions options_;

    std::string lastError_;
    ScriptErrorKind lastErrorKind_{ScriptErrorKind::None};
};

} // namespace playscript::game
