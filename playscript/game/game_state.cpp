#include "game_state.hpp"

#include <playscript/core/logger.hpp>

#include <climits>
#include <cmath>
#include <cstring>

namespace playscript::game {

namespace {

bool is_known_key(const std::string& key) {
    static const char* const kKnown[] = {
        state_keys::kScore,
        state_keys::kTimeRemaining,
        state_keys::kCurrentChallenge,
        state_keys::kCurrentAnswer,
        state_keys::kIsPlaying,
        state_keys::kWrongGuesses,
        state_keys::kMaxWrongGuesses,
        state_keys::kHints,
    };
    for (const char* k : kKnown) {
        if (key == k) return true;
    }
    return false;
}

int clamp_to_int(double v) {
    if (std::isnan(v)) return 0;
    if (v >= static_cast<double>(INT_MAX)) return INT_MAX;
    if (v <= static_cast<double>(INT_MIN)) return INT_MIN;
    return static_cast<int>(v);
}

void warn_type(const char* key, const ScriptValue& v) {
    core::logf(core::LogLevel::Debug, "runner", "state field '%s' has type %s; using default",
               key, v.type_name());
}

void read_int(const ScriptValue::Record& rec, const char* key, int& out, bool nonNegative) {
    auto it = rec.find(key);
    if (it == rec.end() || it->second.is_nil()) return;

    if (!it->second.is_number()) {
        warn_type(key, it->second);
        return;
    }

    int v = clamp_to_int(it->second.as_number());
    if (nonNegative && v < 0) v = 0;
    out = v;
}

void read_string(const ScriptValue::Record& rec, const char* key, std::string& out) {
    auto it = rec.find(key);
    if (it == rec.end() || it->second.is_nil()) return;

    if (!it->second.is_string()) {
        warn_type(key, it->second);
        return;
    }
    out = it->second.as_string();
}

void read_bool(const ScriptValue::Record& rec, const char* key, bool& out) {
    auto it = rec.find(key);
    if (it == rec.end() || it->second.is_nil()) return;

    if (!it->second.is_boolean()) {
        warn_type(key, it->second);
        return;
    }
    out = it->second.as_bool();
}

} // namespace

ScriptValue GameState::to_value() const {
    ScriptValue::Record rec = extra;

    rec[state_keys::kScore] = score;
    rec[state_keys::kTimeRemaining] = timeRemaining;
    rec[state_keys::kCurrentChallenge] = currentChallenge;
    if (currentAnswer) {
        rec[state_keys::kCurrentAnswer] = *currentAnswer;
    } else {
        rec.erase(state_keys::kCurrentAnswer);
    }
    rec[state_keys::kIsPlaying] = isPlaying;
    rec[state_keys::kWrongGuesses] = wrongGuesses;
    rec[state_keys::kMaxWrongGuesses] = maxWrongGuesses;

    ScriptValue::Sequence hintSeq;
    hintSeq.reserve(hints.size());
    for (const auto& h : hints) {
        hintSeq.emplace_back(h);
    }
    rec[state_keys::kHints] = std::move(hintSeq);

    return ScriptValue(std::move(rec));
}

std::optional<GameState> GameState::from_value(const ScriptValue& v) {
    if (!v.is_record()) {
        return std::nullopt;
    }

    const auto& rec = v.as_record();
    GameState state;

    read_int(rec, state_keys::kScore, state.score, true);
    read_int(rec, state_keys::kTimeRemaining, state.timeRemaining, false);
    read_string(rec, state_keys::kCurrentChallenge, state.currentChallenge);
    read_bool(rec, state_keys::kIsPlaying, state.isPlaying);
    read_int(rec, state_keys::kWrongGuesses, state.wrongGuesses, true);
    read_int(rec, state_keys::kMaxWrongGuesses, state.maxWrongGuesses, true);

    if (auto it = rec.find(state_keys::kCurrentAnswer); it != rec.end()) {
        if (it->second.is_string()) {
            state.currentAnswer = it->second.as_string();
        } else if (!it->second.is_nil()) {
            warn_type(state_keys::kCurrentAnswer, it->second);
        }
    }

    if (auto it = rec.find(state_keys::kHints); it != rec.end()) {
        const ScriptValue& hints = it->second;
        if (hints.is_sequence()) {
            for (const auto& h : hints.as_sequence()) {
                if (h.is_string()) state.hints.push_back(h.as_string());
            }
        } else if (hints.is_record() && hints.as_record().empty()) {
            // {} from the guest: an empty list that lost its shape at the boundary
        } else if (!hints.is_nil()) {
            warn_type(state_keys::kHints, hints);
        }
    }

    for (const auto& [key, value] : rec) {
        if (!is_known_key(key)) {
            state.extra.emplace(key, value);
        }
    }

    return state;
}

bool GameState::operator==(const GameState& other) const {
    return score == other.score &&
           timeRemaining == other.timeRemaining &&
           currentChallenge == other.currentChallenge &&
           currentAnswer == other.currentAnswer &&
           isPlaying == other.isPlaying &&
           wrongGuesses == other.wrongGuesses &&
           maxWrongGuesses == other.maxWrongGuesses &&
           hints == other.hints &&
           extra == other.extra;
}

GameState default_game_state(int durationSec, int maxWrongGuesses) {
    GameState state;
    state.score = 0;
    state.timeRemaining = durationSec > 0 ? durationSec : kDefaultDurationSec;
    state.currentChallenge = "";
    state.currentAnswer = std::string{};
    state.isPlaying = false;
    state.wrongGuesses = 0;
    state.maxWrongGuesses = maxWrongGuesses >= 0 ? maxWrongGuesses : kDefaultMaxWrongGuesses;
    state.hints.clear();
    return state;
}

} // namespace playscript::game
