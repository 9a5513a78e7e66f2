#include "game_loop.hpp"

#include <playscript/core/config.hpp>
#include <playscript/core/logger.hpp>

#include <climits>
#include <cmath>

namespace playscript::game {

LoopOptions LoopOptions::from_config(const core::Config& config) {
    LoopOptions opts;
    opts.runner = RunnerOptions::from_config(config);
    opts.advanceAfterStart = config.round().advance_after_start;
    opts.forwardTicks = config.round().forward_ticks;
    return opts;
}

const char* loop_phase_name(GameLoop::Phase phase) {
    switch (phase) {
        case GameLoop::Phase::Idle: return "idle";
        case GameLoop::Phase::Initialized: return "initialized";
        case GameLoop::Phase::Playing: return "playing";
        case GameLoop::Phase::Ended: return "ended";
        default: return "unknown";
    }
}

GameLoop::GameLoop(std::string source, GameMetadata metadata, LoopOptions options)
    : source_(std::move(source)), metadata_(std::move(metadata)), options_(std::move(options)) {
    duration_ = metadata_.duration > 0 ? metadata_.duration : options_.runner.defaultDurationSec;
    if (duration_ <= 0) duration_ = kDefaultDurationSec;

    // The built-in state should carry the round length too.
    options_.runner.defaultDurationSec = duration_;
}

GameLoop::~GameLoop() = default;

bool GameLoop::begin() {
    if (phase_ != Phase::Idle) {
        core::logf(core::LogLevel::Debug, "loop", "begin ignored in phase %s", loop_phase_name(phase_));
        return false;
    }

    clear_round();
    error_.clear();

    runner_ = create_runner(source_, options_.runner);
    if (!runner_) {
        error_ = "Game Error: failed to initialize game logic";
        core::logf(core::LogLevel::Error, "loop", "%s", error_.c_str());
        return false;
    }

    timeRemaining_ = duration_;

    GameState s = runner_->init();
    s = runner_->start(s);
    if (options_.advanceAfterStart) {
        s = runner_->get_next_challenge(s);
    }
    apply(std::move(s));

    phase_ = Phase::Initialized;
    core::logf(core::LogLevel::Info, "loop", "round started: %ds, challenge '%s'",
               duration_, state_.currentChallenge.c_str());
    return true;
}

void GameLoop::apply(GameState next) {
    state_ = std::move(next);
    state_.timeRemaining = timeRemaining_;
}

SubmitOutcome GameLoop::submit(const std::string& input) {
    SubmitOutcome outcome;
    if (!running()) return outcome;

    phase_ = Phase::Playing;
    outcome.accepted = true;

    InputResult r = runner_->on_input(state_, input);
    if (r.correct) {
        outcome.correct = true;
        outcome.points = r.points;
        // Each award is already clamped to [0, INT_MAX]; the total saturates.
        pointsAwarded_ = r.points > INT_MAX - pointsAwarded_ ? INT_MAX : pointsAwarded_ + r.points;
        ++challengesCompleted_;
        apply(runner_->get_next_challenge(r.state));
    } else {
        apply(std::move(r.state));
    }

    core::logf(core::LogLevel::Debug, "loop", "submit '%s': %s (+%d)",
               input.c_str(), outcome.correct ? "correct" : "wrong", outcome.points);
    return outcome;
}

bool GameLoop::skip() {
    if (!running()) return false;

    phase_ = Phase::Playing;
    apply(runner_->get_next_challenge(state_));
    return true;
}

std::string GameLoop::hint() {
    if (!running()) return "";
    return runner_->get_hint(state_);
}

void GameLoop::advance(double seconds) {
    if (!running()) return;
    if (!(seconds > 0.0) || std::isinf(seconds)) return;

    phase_ = Phase::Playing;
    pending_ += seconds;
    while (pending_ >= 1.0 && running()) {
        pending_ -= 1.0;
        tick_second();
    }
}

void GameLoop::tick_second() {
    --timeRemaining_;

    if (options_.forwardTicks) {
        apply(runner_->tick(state_, 1.0));
    } else {
        state_.timeRemaining = timeRemaining_;
    }

    if (timeRemaining_ <= 0) {
        end_round();
    }
}

void GameLoop::finish() {
    if (!running()) return;
    end_round();
}

void GameLoop::end_round() {
    phase_ = Phase::Ended;

    RoundSummary summary;
    summary.score = state_.score;
    summary.challengesCompleted = challengesCompleted_;
    summary.pointsAwarded = pointsAwarded_;
    summary.results = runner_->get_results(state_);
    summary_ = std::move(summary);

    core::logf(core::LogLevel::Info, "loop", "round ended: score %d, %d challenge(s), %d point(s) awarded",
               summary_->score, summary_->challengesCompleted, summary_->pointsAwarded);

    if (onRoundEnded_) {
        onRoundEnded_(*summary_);
    }
}

void GameLoop::clear_round() {
    state_ = GameState{};
    timeRemaining_ = 0;
    pending_ = 0.0;
    challengesCompleted_ = 0;
    pointsAwarded_ = 0;
    summary_.reset();
}

void GameLoop::reset() {
    if (runner_) {
        runner_->destroy();
        runner_.reset();
    }

    // The last summary stays readable until the next begin().
    std::optional<RoundSummary> last = std::move(summary_);
    clear_round();
    summary_ = std::move(last);

    phase_ = Phase::Idle;
    error_.clear();
}

void GameLoop::exit() {
    reset();
    summary_.reset();
    core::logf(core::LogLevel::Debug, "loop", "exited");
}

} // namespace playscript::game
