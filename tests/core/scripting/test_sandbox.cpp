/**
 * @file test_sandbox.cpp
 * @brief Unit tests for static script validation and the sandbox factory.
 */

#include <catch2/catch_test_macros.hpp>

#include <playscript/core/scripting/sandbox.hpp>

#include "helpers/test_scripts.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace playscript::scripting;

namespace {

bool mentions(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(), [&needle](const std::string& m) {
        return m.find(needle) != std::string::npos;
    });
}

} // namespace

// =============================================================================
// SandboxConfig
// =============================================================================

TEST_CASE("Game defaults are tighter than the general defaults", "[scripting][sandbox]") {
    SandboxConfig general;
    SandboxConfig games = SandboxConfig::default_for_games();

    REQUIRE(games.maxMemoryMB == 32);
    REQUIRE(games.maxInstructionsPerCall == 5000000);
    REQUIRE(games.maxExecutionTimeSec == 2.0);
    REQUIRE(games.maxMemoryMB < general.maxMemoryMB);
}

TEST_CASE("SandboxConfig converts to byte limits", "[scripting][sandbox]") {
    SandboxConfig cfg;
    cfg.maxMemoryMB = 3;
    cfg.maxInstructionsPerCall = 1234;
    cfg.maxExecutionTimeSec = 0.5;

    ScriptLimits limits = cfg.to_script_limits();
    REQUIRE(limits.maxMemoryBytes == 3u * 1024u * 1024u);
    REQUIRE(limits.maxInstructions == 1234);
    REQUIRE(limits.maxExecutionTimeSec == 0.5);
}

// =============================================================================
// Static validation
// =============================================================================

TEST_CASE("Well-formed game scripts validate", "[scripting][sandbox][validate]") {
    auto result = Sandbox::validate_script(test_helpers::kWordGame);
    REQUIRE(result);
    REQUIRE(result.errors.empty());
}

TEST_CASE("Syntax errors fail validation", "[scripting][sandbox][validate]") {
    auto result = Sandbox::validate_script(test_helpers::kSyntaxError);
    REQUIRE_FALSE(result);
    REQUIRE_FALSE(result.errors.empty());
}

TEST_CASE("Forbidden globals are reported", "[scripting][sandbox][validate]") {
    SECTION("library access") {
        auto result = Sandbox::check_forbidden_calls("local f = io.open('x')");
        REQUIRE_FALSE(result);
        REQUIRE(mentions(result.errors, "io"));
    }

    SECTION("function calls") {
        auto result = Sandbox::check_forbidden_calls("Game = {} local x = require('json')");
        REQUIRE_FALSE(result);
        REQUIRE(mentions(result.errors, "require"));
    }

    SECTION("fields with forbidden names are fine") {
        auto result = Sandbox::check_forbidden_calls(R"lua(
            Game = {}
            function Game.load(state) return state end
            local t = { os = 1 }
            local n = t.os
            return Game.load({})
        )lua");
        REQUIRE(result);
    }
}

TEST_CASE("Bytecode markers fail validation", "[scripting][sandbox][validate]") {
    auto result = Sandbox::check_forbidden_calls("Game = {} local s = '\\27Lua'");
    REQUIRE_FALSE(result);
    REQUIRE(mentions(result.errors, "bytecode"));
}

TEST_CASE("Suspicious patterns are warnings only", "[scripting][sandbox][validate]") {
    SECTION("infinite loop") {
        auto result = Sandbox::check_forbidden_calls("Game = {} while true do break end");
        REQUIRE(result);
        REQUIRE(mentions(result.warnings, "Infinite loop"));
    }

    SECTION("repeat until false") {
        auto result = Sandbox::check_forbidden_calls("Game = {} repeat local a = 1 until false");
        REQUIRE(result);
        REQUIRE(mentions(result.warnings, "Infinite loop"));
    }
}

TEST_CASE("Lifecycle hook check only warns", "[scripting][sandbox][validate]") {
    SECTION("no Game table") {
        auto result = Sandbox::check_lifecycle_hooks("local x = 1");
        REQUIRE(result);
        REQUIRE(mentions(result.warnings, "Game"));
    }

    SECTION("missing hooks are named") {
        auto result = Sandbox::check_lifecycle_hooks(test_helpers::kNoHintGame);
        REQUIRE(result);
        REQUIRE(result.warnings.empty());

        auto partial = Sandbox::check_lifecycle_hooks("Game = {} function Game.init() return {} end");
        REQUIRE(partial);
        REQUIRE(mentions(partial.warnings, "Game.onInput"));
        REQUIRE_FALSE(mentions(partial.warnings, "Game.init"));
    }

    SECTION("table constructor fields count") {
        auto result = Sandbox::check_lifecycle_hooks(R"lua(
            local Game = {
                init = function() return {} end,
                start = function(s) return s end,
                onInput = function(s, i) return s end,
                getNextChallenge = function(s) return s end,
            }
            return Game
        )lua");
        REQUIRE(result.warnings.empty());
    }

    SECTION("custom module name") {
        auto result = Sandbox::check_lifecycle_hooks(test_helpers::kWordGame, "Quiz");
        REQUIRE(mentions(result.warnings, "Quiz"));
    }
}

TEST_CASE("validate_script merges every check", "[scripting][sandbox][validate]") {
    auto result = Sandbox::validate_script("Game = {} function Game.init() return os.time() end");
    REQUIRE_FALSE(result);
    REQUIRE(mentions(result.errors, "os"));
    REQUIRE(mentions(result.warnings, "Game.start"));
}

TEST_CASE("Forbidden list covers host access", "[scripting][sandbox]") {
    const auto& list = Sandbox::forbidden_functions();
    for (const char* name : {"os", "io", "debug", "require", "load", "dofile"}) {
        INFO(name);
        REQUIRE(std::find(list.begin(), list.end(), name) != list.end());
    }
}

// =============================================================================
// Factory
// =============================================================================

TEST_CASE("Sandbox::create routes print to the handler", "[scripting][sandbox]") {
    std::vector<std::string> printed;

    SandboxConfig cfg = SandboxConfig::default_for_games();
    cfg.printHandler = [&printed](const std::string& msg) { printed.push_back(msg); };

    auto lua = Sandbox::create(cfg);
    REQUIRE(lua);
    REQUIRE(lua->is_sandboxed());

    REQUIRE(lua->execute("print('score', 10, true)"));
    REQUIRE(printed.size() == 1);
    REQUIRE(printed[0] == "score\t10\ttrue");
}

TEST_CASE("Sandbox::create without a handler swallows print", "[scripting][sandbox]") {
    auto lua = Sandbox::create(SandboxConfig::default_for_games());
    REQUIRE(lua);
    REQUIRE(lua->execute("print('nobody listens')"));
}
