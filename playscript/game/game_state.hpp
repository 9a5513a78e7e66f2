#pragma once

#include <playscript/core/scripting/script_value.hpp>

#include <optional>
#include <string>
#include <vector>

namespace playscript::game {

using scripting::ScriptValue;

// State record passed into and returned from every lifecycle call.
//
// The documented fields are typed; anything else the script stores lives in
// `extra` and is passed back to the script untouched.
struct GameState {
    int score{0};
    int timeRemaining{0};              // seconds; may dip below zero transiently
    std::string currentChallenge;
    std::optional<std::string> currentAnswer;  // some scripts keep the answer to themselves
    bool isPlaying{false};
    int wrongGuesses{0};
    int maxWrongGuesses{0};            // 0 = unlimited
    std::vector<std::string> hints;

    ScriptValue::Record extra;

    ScriptValue to_value() const;

    // nullopt unless v is a record. An empty guest table decodes as the
    // default state, since it arrives as an empty record.
    static std::optional<GameState> from_value(const ScriptValue& v);

    bool operator==(const GameState& other) const;
    bool operator!=(const GameState& other) const { return !(*this == other); }
};

// Result of one player submission.
struct InputResult {
    GameState state;
    bool correct{false};
    int points{0};
};

constexpr int kDefaultDurationSec = 60;
constexpr int kDefaultMaxWrongGuesses = 6;

// Built-in state used when a script's init() is unusable.
GameState default_game_state(int durationSec = kDefaultDurationSec,
                             int maxWrongGuesses = kDefaultMaxWrongGuesses);

namespace state_keys {
constexpr const char* kScore = "score";
constexpr const char* kTimeRemaining = "timeRemaining";
constexpr const char* kCurrentChallenge = "currentChallenge";
constexpr const char* kCurrentAnswer = "currentAnswer";
constexpr const char* kIsPlaying = "isPlaying";
constexpr const char* kWrongGuesses = "wrongGuesses";
constexpr const char* kMaxWrongGuesses = "maxWrongGuesses";
constexpr const char* kHints = "hints";
} // namespace state_keys

} // namespace playscript::game
