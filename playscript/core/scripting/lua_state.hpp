#pragma once

#include "script_types.hpp"
#include "script_value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sol/forward.hpp>

struct lua_State;

namespace playscript::scripting {

// Memory and instruction limits for sandboxed scripts
struct ScriptLimits {
    std::size_t maxMemoryBytes{64 * 1024 * 1024};  // 64 MB default
    std::size_t maxInstructions{10000000};          // 10M instructions per call
    double maxExecutionTimeSec{5.0};                // 5 seconds max
};

// Lua VM wrapper with optional sandboxing.
//
// One instance owns one guest heap; nothing is shared between instances.
// Not thread-safe: confine each instance to a single owner.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Non-copyable, movable
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&&) noexcept;
    LuaState& operator=(LuaState&&) noexcept;

    // Create the VM with a tracked allocator capped at memoryLimit bytes
    // (0 = unlimited) and open the safe standard libraries.
    // Returns false only if no guest heap could be allocated.
    bool init(std::size_t memoryLimit = 0);

    // Apply sandbox restrictions (removes dangerous functions)
    void apply_sandbox(const ScriptLimits& limits = {});

    // Check if sandbox is active
    bool is_sandboxed() const { return sandboxed_; }

    // Load and execute a script string. If exportAs is non-empty, the chunk
    // returned a table and no global of that name exists yet, the returned
    // table is published under that global.
    ScriptResult execute(const std::string& script, const std::string& chunkName = "script",
                         const std::string& exportAs = {});

    // Compile a script without executing (for syntax checking)
    ScriptResult load(const std::string& script, const std::string& chunkName = "script");

    // Call a function by dotted path ("Game.onInput"), marshaling args and the
    // first return value. Guest errors, missing paths and unmarshalable
    // returns come back as a failed CallResult; the Lua stack is left at the
    // depth it had on entry.
    CallResult call(const std::string& dottedPath, const std::vector<ScriptValue>& args = {});

    // Check if a function exists at the dotted path
    bool has_function(const std::string& dottedPath) const;

    // Set/get a global through the marshaling layer
    void set_global(const std::string& name, const ScriptValue& value);
    std::optional<ScriptValue> get_global(const std::string& name) const;

    // Access the underlying sol::state_view (for advanced usage)
    sol::state_view& state();
    const sol::state_view& state() const;

    // Get raw lua_State pointer (for C API interop)
    lua_State* lua_state();

    // Memory usage tracking
    std::size_t memory_used() const;
    bool memory_limited() const;

    // Whether the last load/call was cut off by the instruction or time budget
    bool budget_exceeded() const;

    // Reset the state (clear all globals, keep sandbox)
    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool sandboxed_{false};
    std::size_t memoryLimit_{0};
    ScriptLimits limits_{};
};

// Walks nested tables from the global scope. Graceful miss: returns nullopt
// (and a reason in *why) when a segment is nil/not a table or the final value
// is not callable.
std::optional<sol::protected_function> resolve_function(sol::state_view& lua, const std::string& dottedPath,
                                                         std::string* why = nullptr);

// Convenience function to create a sandboxed Lua state
std::unique_ptr<LuaState> create_sandboxed_state(const ScriptLimits& limits = {});

} // namespace playscript::scripting
