/**
 * @file test_lua_state.cpp
 * @brief Unit tests for the Lua VM wrapper: loading, calls, limits, isolation.
 */

#include <catch2/catch_test_macros.hpp>

#include <playscript/core/scripting/scripting.hpp>

#include "helpers/test_scripts.hpp"

#include <sol/sol.hpp>

#include <chrono>

using namespace playscript::scripting;

namespace {

std::unique_ptr<LuaState> sandboxed(const ScriptLimits& limits = {}) {
    test_helpers::quiet_logging();
    auto lua = create_sandboxed_state(limits);
    REQUIRE(lua);
    return lua;
}

} // namespace

// =============================================================================
// Creation
// =============================================================================

TEST_CASE("LuaState initializes with and without a memory limit", "[scripting][lua_state]") {
    LuaState unlimited;
    REQUIRE(unlimited.init());
    REQUIRE_FALSE(unlimited.is_sandboxed());

    LuaState limited;
    REQUIRE(limited.init(8 * 1024 * 1024));
    REQUIRE(limited.memory_used() > 0);
}

TEST_CASE("create_sandboxed_state returns a sandboxed state", "[scripting][lua_state]") {
    auto lua = sandboxed();
    REQUIRE(lua->is_sandboxed());
}

// =============================================================================
// Loading
// =============================================================================

TEST_CASE("Syntax errors are Load errors, not exceptions", "[scripting][lua_state][load]") {
    auto lua = sandboxed();

    ScriptResult r;
    REQUIRE_NOTHROW(r = lua->execute(test_helpers::kSyntaxError, "logic.lua"));
    REQUIRE_FALSE(r);
    REQUIRE(r.kind == ScriptErrorKind::Load);
    REQUIRE(r.error.find("logic.lua") != std::string::npos);
}

TEST_CASE("Top-level runtime errors are Load errors", "[scripting][lua_state][load]") {
    auto lua = sandboxed();
    auto r = lua->execute(test_helpers::kTopLevelError);
    REQUIRE_FALSE(r);
    REQUIRE(r.kind == ScriptErrorKind::Load);
    REQUIRE(r.error.find("refusing to load") != std::string::npos);
}

TEST_CASE("load checks syntax without running the chunk", "[scripting][lua_state][load]") {
    auto lua = sandboxed();
    REQUIRE(lua->load("ran = true"));
    REQUIRE(lua->get_global("ran").value().is_nil());
    REQUIRE_FALSE(lua->load("if then"));
}

TEST_CASE("Precompiled bytecode is refused", "[scripting][lua_state][load]") {
    auto lua = sandboxed();
    const std::string bytecode = std::string("\x1bLua") + std::string(32, '\0');
    auto r = lua->execute(bytecode);
    REQUIRE_FALSE(r);
    REQUIRE(r.kind == ScriptErrorKind::Load);
}

TEST_CASE("A returned module table is published when the global is absent", "[scripting][lua_state][load]") {
    auto lua = sandboxed();

    SECTION("local module is exported") {
        REQUIRE(lua->execute("local M = {} function M.ping() return 'pong' end return M", "m.lua", "Game"));
        auto r = lua->call("Game.ping");
        REQUIRE(r);
        REQUIRE(r.value.as_string() == "pong");
    }

    SECTION("an existing global is left alone") {
        REQUIRE(lua->execute(R"lua(
            Game = { ping = function() return 'global' end }
            return { ping = function() return 'returned' end }
        )lua", "m.lua", "Game"));
        REQUIRE(lua->call("Game.ping").value.as_string() == "global");
    }

    SECTION("non-table returns are ignored") {
        REQUIRE(lua->execute("return 5", "m.lua", "Game"));
        REQUIRE(lua->get_global("Game").value().is_nil());
    }
}

// =============================================================================
// Calls and dotted-path resolution
// =============================================================================

TEST_CASE("call resolves nested dotted paths", "[scripting][lua_state][call]") {
    auto lua = sandboxed();
    REQUIRE(lua->execute(R"lua(
        Game = { util = { add = function(a, b) return a + b end } }
        function top() return 'top' end
    )lua"));

    auto sum = lua->call("Game.util.add", {ScriptValue(2), ScriptValue(3)});
    REQUIRE(sum);
    REQUIRE(sum.value.as_integer() == 5);

    REQUIRE(lua->call("top").value.as_string() == "top");
    REQUIRE(lua->has_function("Game.util.add"));
    REQUIRE_FALSE(lua->has_function("Game.util"));
}

TEST_CASE("Path misses come back as descriptive Call errors", "[scripting][lua_state][call]") {
    auto lua = sandboxed();
    REQUIRE(lua->execute("Game = { value = 3 }"));

    SECTION("missing root") {
        auto r = lua->call("Nope.init");
        REQUIRE_FALSE(r);
        REQUIRE(r.kind == ScriptErrorKind::Call);
        REQUIRE(r.error.find("Nope is nil") != std::string::npos);
    }

    SECTION("intermediate is not a table") {
        auto r = lua->call("Game.value.init");
        REQUIRE_FALSE(r);
        REQUIRE(r.error.find("not a table") != std::string::npos);
    }

    SECTION("final segment not callable") {
        auto r = lua->call("Game.value");
        REQUIRE_FALSE(r);
        REQUIRE(r.error.find("not a function") != std::string::npos);
    }

    SECTION("empty segments") {
        REQUIRE_FALSE(lua->call("Game..init"));
        REQUIRE_FALSE(lua->call(""));
    }
}

TEST_CASE("resolve_function does not trigger __index", "[scripting][lua_state][call]") {
    LuaState lua;
    REQUIRE(lua.init());
    REQUIRE(lua.execute(R"lua(
        touched = false
        Game = setmetatable({}, { __index = function() touched = true return function() end end })
    )lua"));

    std::string why;
    REQUIRE_FALSE(resolve_function(lua.state(), "Game.init", &why).has_value());
    REQUIRE_FALSE(why.empty());
    REQUIRE_FALSE(lua.get_global("touched").value().as_bool());
}

TEST_CASE("Guest runtime errors are caught", "[scripting][lua_state][call]") {
    auto lua = sandboxed();
    REQUIRE(lua->execute(R"lua(
        function nil_index() local t = nil return t.x end
        function raise() error({ code = 1 }) end
        local function dive(n) return dive(n + 1) + 1 end
        function overflow() return dive(0) end
    )lua"));

    auto a = lua->call("nil_index");
    REQUIRE_FALSE(a);
    REQUIRE(a.kind == ScriptErrorKind::Call);
    REQUIRE(a.error.rfind("nil_index: ", 0) == 0);

    REQUIRE_FALSE(lua->call("raise"));
    REQUIRE_FALSE(lua->call("overflow"));
}

TEST_CASE("Only the first return value is kept", "[scripting][lua_state][call]") {
    auto lua = sandboxed();
    REQUIRE(lua->execute("function many() return 1, 2, 3 end function none() end"));

    REQUIRE(lua->call("many").value.as_integer() == 1);

    auto none = lua->call("none");
    REQUIRE(none);
    REQUIRE(none.value.is_nil());
}

TEST_CASE("The Lua stack is balanced on every exit path", "[scripting][lua_state][call]") {
    auto lua = sandboxed();
    REQUIRE(lua->execute(R"lua(
        function ok() return { a = 1 } end
        function bad() error('x') end
        function fn() return function() end end
    )lua"));

    lua_State* L = lua->lua_state();
    const int before = lua_gettop(L);

    for (int i = 0; i < 50; ++i) {
        (void)lua->call("ok");
        (void)lua->call("bad");
        (void)lua->call("fn");
        (void)lua->call("missing.path");
        (void)lua->has_function("ok");
        (void)lua->execute("syntax error here");
    }

    REQUIRE(lua_gettop(L) == before);
}

// =============================================================================
// Sandbox and limits
// =============================================================================

TEST_CASE("Sandbox removes host access", "[scripting][lua_state][sandbox]") {
    auto lua = sandboxed();

    for (const char* name : {"os", "io", "debug", "require", "package", "load",
                             "loadstring", "dofile", "loadfile", "setmetatable", "collectgarbage"}) {
        INFO(name);
        REQUIRE(lua->get_global(name).has_value());
        REQUIRE(lua->get_global(name)->is_nil());
    }

    auto r = lua->execute("os.exit(1)");
    REQUIRE_FALSE(r);

    // Pure libraries stay available.
    REQUIRE(lua->execute("assert(string.upper('a') == 'A') assert(math.floor(1.5) == 1)"));
}

TEST_CASE("Instruction budget stops infinite loops", "[scripting][lua_state][limits]") {
    ScriptLimits limits;
    limits.maxInstructions = 200000;
    limits.maxExecutionTimeSec = 5.0;
    auto lua = sandboxed(limits);
    REQUIRE(lua->execute("function spin() while true do end end function quick() return 1 end"));

    const auto start = std::chrono::steady_clock::now();
    auto r = lua->call("spin");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(r);
    REQUIRE(r.kind == ScriptErrorKind::Call);
    REQUIRE(lua->budget_exceeded());
    REQUIRE(elapsed < std::chrono::seconds(5));

    // The budget is per call.
    auto next = lua->call("quick");
    REQUIRE(next);
    REQUIRE_FALSE(lua->budget_exceeded());
}

TEST_CASE("Guest error handlers cannot swallow the budget", "[scripting][lua_state][limits]") {
    ScriptLimits limits;
    limits.maxInstructions = 200000;
    limits.maxExecutionTimeSec = 5.0;
    auto lua = sandboxed(limits);
    REQUIRE(lua->execute(R"lua(
        function spin_pcall()
            while true do pcall(function() while true do end end) end
        end
        function spin_xpcall()
            while true do
                xpcall(function() while true do end end, function(e) return e end)
            end
        end
        function spin_coroutine()
            while true do
                local co = coroutine.create(function() while true do end end)
                coroutine.resume(co)
            end
        end
        kept = coroutine.create(function() while true do end end)
        function spin_kept() while true do coroutine.resume(kept) end end
        function count_to(n) local i = 0 while i < n do i = i + 1 end return i end
    )lua"));

    for (const char* fn : {"spin_pcall", "spin_xpcall", "spin_coroutine", "spin_kept"}) {
        INFO(fn);
        const auto start = std::chrono::steady_clock::now();
        auto r = lua->call(fn);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(r);
        REQUIRE(r.kind == ScriptErrorKind::Call);
        REQUIRE(r.error.find("instruction limit") != std::string::npos);
        REQUIRE(lua->budget_exceeded());
        REQUIRE(elapsed < std::chrono::seconds(5));

        // The next call gets a fresh budget at the normal rate.
        auto next = lua->call("count_to", {ScriptValue(10000)});
        REQUIRE(next);
        REQUIRE(next.value.as_integer() == 10000);
        REQUIRE_FALSE(lua->budget_exceeded());
    }
}

TEST_CASE("Wall-clock budget stops long calls", "[scripting][lua_state][limits]") {
    ScriptLimits limits;
    limits.maxInstructions = 0;  // unlimited
    limits.maxExecutionTimeSec = 0.2;
    auto lua = sandboxed(limits);
    REQUIRE(lua->execute("function spin() local i = 0 while true do i = i + 1 end end"));

    auto r = lua->call("spin");
    REQUIRE_FALSE(r);
    REQUIRE(r.error.find("time limit") != std::string::npos);
}

TEST_CASE("Top-level infinite loops are cut off at load", "[scripting][lua_state][limits]") {
    ScriptLimits limits;
    limits.maxInstructions = 100000;
    auto lua = sandboxed(limits);

    auto r = lua->execute("while true do end");
    REQUIRE_FALSE(r);
    REQUIRE(r.kind == ScriptErrorKind::Load);
}

TEST_CASE("Memory-hungry calls fail without taking down the host", "[scripting][lua_state][limits]") {
    ScriptLimits limits;
    limits.maxMemoryBytes = 4 * 1024 * 1024;
    limits.maxInstructions = 2000000;
    limits.maxExecutionTimeSec = 5.0;
    auto lua = sandboxed(limits);
    REQUIRE(lua->execute(R"lua(
        function hog()
            local t = {}
            for i = 1, 1e9 do t[i] = string.rep('x', 64) .. i end
            return #t
        end
        function small() return 'fine' end
    )lua"));

    auto r = lua->call("hog");
    REQUIRE_FALSE(r);

    if (lua->memory_limited()) {
        REQUIRE(lua->memory_used() <= limits.maxMemoryBytes);
    }

    // The state stays usable afterwards.
    lua_gc(lua->lua_state(), LUA_GCCOLLECT, 0);
    auto after = lua->call("small");
    REQUIRE(after);
    REQUIRE(after.value.as_string() == "fine");
}

// =============================================================================
// Isolation and reset
// =============================================================================

TEST_CASE("Separate states share no globals", "[scripting][lua_state][isolation]") {
    auto a = sandboxed();
    auto b = sandboxed();

    REQUIRE(a->execute("shared = 'from a'"));
    REQUIRE(b->get_global("shared").value().is_nil());

    REQUIRE(b->execute("shared = 'from b'"));
    REQUIRE(a->get_global("shared").value().as_string() == "from a");
}

TEST_CASE("reset clears globals and keeps the sandbox", "[scripting][lua_state][reset]") {
    auto lua = sandboxed();
    REQUIRE(lua->execute("Game = {} leftover = 1"));

    lua->reset();

    REQUIRE(lua->is_sandboxed());
    REQUIRE(lua->get_global("leftover").value().is_nil());
    REQUIRE(lua->get_global("os").value().is_nil());
    REQUIRE(lua->execute("Game = { ok = function() return true end }"));
    REQUIRE(lua->call("Game.ok").value.as_bool());
}
