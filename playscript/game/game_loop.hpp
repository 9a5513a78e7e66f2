#pragma once

#include "game_metadata.hpp"
#include "game_runner.hpp"
#include "game_state.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace playscript::game {

struct LoopOptions {
    RunnerOptions runner{};

    // Call getNextChallenge right after start() so the first prompt is ready.
    bool advanceAfterStart{true};

    // Forward each countdown second to Game.tick when the script defines it.
    bool forwardTicks{false};

    static LoopOptions from_config(const core::Config& config);
};

struct SubmitOutcome {
    bool accepted{false};   // false when no round is running
    bool correct{false};
    int points{0};
};

struct RoundSummary {
    int score{0};                 // from the last known GameState
    int challengesCompleted{0};
    int pointsAwarded{0};         // host-side sum of awarded points
    ScriptValue::Record results;  // Game.getResults or {score = ...}
};

// Timed, scored round driven by the host.
//
// Idle -> Initialized (begin) -> Playing (first submission or countdown
// second) -> Ended (countdown reaches zero). reset() returns to Idle and the
// next begin() loads the script again. The host owns the clock: whatever the
// script writes to timeRemaining is overwritten after each call.
class GameLoop {
public:
    enum class Phase : std::uint8_t {
        Idle,
        Initialized,
        Playing,
        Ended,
    };

    using RoundEndedCallback = std::function<void(const RoundSummary&)>;

    GameLoop(std::string source, GameMetadata metadata, LoopOptions options = {});
    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    // Creates the runner and runs init/start. False (with error() set) when
    // the script cannot be loaded, or when called outside Idle.
    // EngineFatalError from create_runner is not caught here.
    bool begin();

    SubmitOutcome submit(const std::string& input);

    // Moves to the next challenge without scoring.
    bool skip();

    std::string hint();

    // Host countdown. Whole seconds are applied one at a time; the remainder
    // carries over to the next call.
    void advance(double seconds);

    // Ends the round now, as if the countdown had run out.
    void finish();

    void reset();
    void exit();

    Phase phase() const { return phase_; }
    bool running() const { return phase_ == Phase::Initialized || phase_ == Phase::Playing; }

    const GameState& state() const { return state_; }
    const std::string& error() const { return error_; }

    int time_remaining() const { return timeRemaining_; }
    int duration() const { return duration_; }
    int challenges_completed() const { return challengesCompleted_; }
    int points_awarded() const { return pointsAwarded_; }

    const GameMetadata& metadata() const { return metadata_; }
    const std::optional<RoundSummary>& summary() const { return summary_; }

    GameRunner* runner() { return runner_.get(); }

    void set_on_round_ended(RoundEndedCallback cb) { onRoundEnded_ = std::move(cb); }

private:
    void apply(GameState next);
    void tick_second();
    void end_round();
    void clear_round();

    std::string source_;
    GameMetadata metadata_;
    LoopOptions options_;
    int duration_{kDefaultDurationSec};

    std::unique_ptr<GameRunner> runner_;
    Phase phase_{Phase::Idle};

    GameState state_{};
    int timeRemaining_{0};
    double pending_{0.0};
    int challengesCompleted_{0};
    int pointsAwarded_{0};

    std::string error_;
    std::optional<RoundSummary> summary_;
    RoundEndedCallback onRoundEnded_;
};

const char* loop_phase_name(GameLoop::Phase phase);

} // namespace playscript::game
