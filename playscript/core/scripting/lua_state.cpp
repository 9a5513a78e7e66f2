#include "lua_state.hpp"
#include "marshal.hpp"

#include "../logger.hpp"

#include <sol/sol.hpp>

#ifdef PLAYSCRIPT_LUAJIT
#include <luajit.h>
#endif

#include <atomic>
#include <chrono>
#include <cstdlib>

namespace playscript::scripting {

namespace {

constexpr int kHookInterval = 1000;
constexpr const char* kLimiterKey = "__exec_limiter";

// Custom allocator for memory tracking
struct MemoryTracker {
    std::atomic<std::size_t> allocated{0};
    std::size_t limit{0};
    std::size_t attempts{0};

    static void* alloc(void* ud, void* ptr, std::size_t osize, std::size_t nsize) {
        auto* tracker = static_cast<MemoryTracker*>(ud);

        if (nsize == 0) {
            // Free
            if (ptr) {
                tracker->allocated -= osize;
                std::free(ptr);
            }
            return nullptr;
        }

        ++tracker->attempts;

        if (ptr == nullptr) {
            // Allocate (osize carries the object type tag here, not a size)
            if (tracker->limit > 0 && tracker->allocated + nsize > tracker->limit) {
                return nullptr;  // Memory limit exceeded
            }
            void* newPtr = std::malloc(nsize);
            if (newPtr) {
                tracker->allocated += nsize;
            }
            return newPtr;
        }

        // Reallocate
        std::size_t delta = nsize > osize ? nsize - osize : 0;
        if (tracker->limit > 0 && delta > 0 && tracker->allocated + delta > tracker->limit) {
            return nullptr;  // Memory limit exceeded
        }

        void* newPtr = std::realloc(ptr, nsize);
        if (newPtr) {
            tracker->allocated = tracker->allocated - osize + nsize;
        }
        return newPtr;
    }
};

// Instruction count hook for limiting execution
struct ExecutionLimiter {
    std::size_t instructionCount{0};
    std::size_t maxInstructions{0};
    std::chrono::steady_clock::time_point startTime;
    double maxTimeSec{0.0};
    bool exceeded{false};
    const char* reason{""};

    static void hook(lua_State* L, lua_Debug*) {
        // The limiter is stored in registry
        lua_getfield(L, LUA_REGISTRYINDEX, kLimiterKey);
        auto* limiter = static_cast<ExecutionLimiter*>(lua_touserdata(L, -1));
        lua_pop(L, 1);

        if (!limiter) return;

        // A guest pcall or coroutine.resume catches the error like any other.
        // Once tripped, every further instruction raises it again until the
        // error reaches the host.
        if (limiter->exceeded) {
            trip(L, limiter, limiter->reason);
        }

        const int count = lua_gethookcount(L);
        limiter->instructionCount += static_cast<std::size_t>(count > 0 ? count : kHookInterval);

        // Coroutine left armed per-instruction by an earlier tripped call.
        if (count != kHookInterval) {
            lua_sethook(L, hook, LUA_MASKCOUNT, kHookInterval);
        }

        if (limiter->maxInstructions > 0 && limiter->instructionCount > limiter->maxInstructions) {
            trip(L, limiter, "instruction limit exceeded");
        }

        if (limiter->maxTimeSec > 0.0) {
            auto now = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration<double>(now - limiter->startTime).count();
            if (elapsed > limiter->maxTimeSec) {
                trip(L, limiter, "execution time limit exceeded");
            }
        }
    }

    static void trip(lua_State* L, ExecutionLimiter* limiter, const char* reason) {
        limiter->exceeded = true;
        limiter->reason = reason;
        lua_sethook(L, hook, LUA_MASKCOUNT, 1);
        luaL_error(L, "%s", reason);
    }
};

struct LuaCloser {
    void operator()(lua_State* L) const {
        if (L) lua_close(L);
    }
};

// Restores the Lua stack to its depth at construction on every exit path.
class StackGuard {
public:
    explicit StackGuard(lua_State* L) : L_(L), top_(lua_gettop(L)) {}
    ~StackGuard() { lua_settop(L_, top_); }

    StackGuard(const StackGuard&) = delete;
    StackGuard& operator=(const StackGuard&) = delete;

private:
    lua_State* L_;
    int top_;
};

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '.') {
            parts.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(std::move(current));
    return parts;
}

} // namespace

struct LuaState::Impl {
    // Declaration order matters: the VM must close before its allocator goes away.
    std::unique_ptr<MemoryTracker> memTracker;
    std::unique_ptr<ExecutionLimiter> execLimiter;
    std::unique_ptr<lua_State, LuaCloser> L;
    std::unique_ptr<sol::state_view> view;

    Impl() = default;

    bool create(std::size_t memLimit) {
        memTracker = std::make_unique<MemoryTracker>();
        memTracker->limit = memLimit;

        lua_State* raw = lua_newstate(&MemoryTracker::alloc, memTracker.get());
        if (!raw && memTracker->attempts == 0) {
            // The backend refused a custom allocator outright (64-bit LuaJIT
            // without GC64); use its own allocator instead.
            memTracker.reset();
            raw = luaL_newstate();
            if (raw && memLimit > 0) {
                core::logf(core::LogLevel::Warning, "script",
                           "custom allocator unsupported by Lua backend; guest memory limit not enforced");
            }
        }

        if (!raw) {
            return false;
        }

        L.reset(raw);
        sol::set_default_state(raw);
        view = std::make_unique<sol::state_view>(raw);
        return true;
    }

    void open_default_libraries() {
        view->open_libraries(
            sol::lib::base,
            sol::lib::coroutine,
            sol::lib::string,
            sol::lib::table,
            sol::lib::math,
            sol::lib::utf8
        );
    }

    void setup_execution_limiter(const ScriptLimits& limits) {
        execLimiter = std::make_unique<ExecutionLimiter>();
        execLimiter->maxInstructions = limits.maxInstructions;
        execLimiter->maxTimeSec = limits.maxExecutionTimeSec;

        // Store limiter in registry for hook access
        lua_pushlightuserdata(L.get(), execLimiter.get());
        lua_setfield(L.get(), LUA_REGISTRYINDEX, kLimiterKey);

#ifdef PLAYSCRIPT_LUAJIT
        // Compiled traces never run count hooks.
        luaJIT_setmode(L.get(), 0, LUAJIT_MODE_ENGINE | LUAJIT_MODE_OFF);
#endif

        lua_sethook(L.get(), ExecutionLimiter::hook, LUA_MASKCOUNT, kHookInterval);
    }

    void reset_execution_limiter() {
        if (execLimiter) {
            execLimiter->instructionCount = 0;
            execLimiter->startTime = std::chrono::steady_clock::now();
            execLimiter->exceeded = false;
            execLimiter->reason = "";
            lua_sethook(L.get(), ExecutionLimiter::hook, LUA_MASKCOUNT, kHookInterval);
        }
    }
};

LuaState::LuaState() : impl_(std::make_unique<Impl>()) {}

LuaState::~LuaState() = default;

LuaState::LuaState(LuaState&&) noexcept = default;
LuaState& LuaState::operator=(LuaState&&) noexcept = default;

bool LuaState::init(std::size_t memoryLimit) {
    memoryLimit_ = memoryLimit;
    if (!impl_->create(memoryLimit)) {
        return false;
    }
    impl_->open_default_libraries();
    return true;
}

void LuaState::apply_sandbox(const ScriptLimits& limits) {
    limits_ = limits;
    sandboxed_ = true;

    auto& lua = *impl_->view;

    // Remove dangerous libraries/functions
    lua["os"] = sol::lua_nil;
    lua["io"] = sol::lua_nil;
    lua["debug"] = sol::lua_nil;
    lua["loadfile"] = sol::lua_nil;
    lua["dofile"] = sol::lua_nil;
    lua["load"] = sol::lua_nil;       // Can load bytecode
    lua["loadstring"] = sol::lua_nil;
    lua["require"] = sol::lua_nil;    // File system access
    lua["package"] = sol::lua_nil;
    lua["collectgarbage"] = sol::lua_nil;  // Can cause DoS
    lua["rawget"] = sol::lua_nil;
    lua["rawset"] = sol::lua_nil;
    lua["rawequal"] = sol::lua_nil;
    lua["setmetatable"] = sol::lua_nil;  // Prevent metatable manipulation
    lua["getfenv"] = sol::lua_nil;
    lua["setfenv"] = sol::lua_nil;
    lua["newproxy"] = sol::lua_nil;
    lua["gcinfo"] = sol::lua_nil;
    lua["module"] = sol::lua_nil;

    impl_->setup_execution_limiter(limits);

    // Sandbox::create replaces this with a handler routed to the host log
    lua["print"] = [](sol::variadic_args va) {
        (void)va;
    };
}

ScriptResult LuaState::execute(const std::string& script, const std::string& chunkName,
                               const std::string& exportAs) {
    StackGuard guard(impl_->L.get());

    try {
        // Text only: precompiled bytecode is never accepted from scripts.
        sol::load_result chunk = impl_->view->load(script, chunkName, sol::load_mode::text);
        if (!chunk.valid()) {
            sol::error err = chunk;
            return ScriptResult::fail(err.what(), ScriptErrorKind::Load);
        }

        if (sandboxed_) {
            impl_->reset_execution_limiter();
        }

        sol::protected_function fn = chunk;
        sol::protected_function_result result = fn();
        if (!result.valid()) {
            sol::error err = result;
            return ScriptResult::fail(err.what(), ScriptErrorKind::Load);
        }

        if (!exportAs.empty() && result.return_count() > 0) {
            sol::object returned = result.get<sol::object>();
            sol::object existing = impl_->view->globals().raw_get<sol::object>(exportAs);
            if (returned.get_type() == sol::type::table && existing.get_type() == sol::type::lua_nil) {
                impl_->view->globals().raw_set(exportAs, returned);
            }
        }
    } catch (const std::exception& e) {
        return ScriptResult::fail(e.what(), ScriptErrorKind::Load);
    }

    return ScriptResult::ok();
}

ScriptResult LuaState::load(const std::string& script, const std::string& chunkName) {
    StackGuard guard(impl_->L.get());

    auto loadResult = impl_->view->load(script, chunkName, sol::load_mode::text);

    if (!loadResult.valid()) {
        sol::error err = loadResult;
        return ScriptResult::fail(err.what(), ScriptErrorKind::Load);
    }

    return ScriptResult::ok();
}

CallResult LuaState::call(const std::string& dottedPath, const std::vector<ScriptValue>& args) {
    StackGuard guard(impl_->L.get());

    try {
        std::string why;
        auto fn = resolve_function(*impl_->view, dottedPath, &why);
        if (!fn) {
            return CallResult::fail(why, ScriptErrorKind::Call);
        }

        std::vector<sol::object> guestArgs;
        guestArgs.reserve(args.size());
        for (const auto& arg : args) {
            guestArgs.push_back(to_guest(*impl_->view, arg));
        }

        if (sandboxed_) {
            impl_->reset_execution_limiter();
        }

        sol::protected_function_result result = (*fn)(sol::as_args(guestArgs));
        if (!result.valid()) {
            sol::error err = result;
            return CallResult::fail(dottedPath + ": " + err.what(), ScriptErrorKind::Call);
        }

        // Exactly one value comes back: extra returns are dropped, none means nil.
        sol::object first = result.return_count() > 0
            ? result.get<sol::object>()
            : sol::make_object(*impl_->view, sol::lua_nil);

        auto marshaled = to_host(first);
        if (!marshaled) {
            return CallResult::fail(dottedPath + ": " + marshaled.error, ScriptErrorKind::Marshal);
        }

        return CallResult::ok(std::move(marshaled.value));
    } catch (const std::exception& e) {
        // Unprotected Lua errors (e.g. allocation failure while building
        // arguments) surface through sol's panic handler as sol::error.
        return CallResult::fail(dottedPath + ": " + e.what(), ScriptErrorKind::Call);
    }
}

bool LuaState::has_function(const std::string& dottedPath) const {
    StackGuard guard(impl_->L.get());
    return resolve_function(*impl_->view, dottedPath).has_value();
}

void LuaState::set_global(const std::string& name, const ScriptValue& value) {
    StackGuard guard(impl_->L.get());
    impl_->view->globals().raw_set(name, to_guest(*impl_->view, value));
}

std::optional<ScriptValue> LuaState::get_global(const std::string& name) const {
    StackGuard guard(impl_->L.get());

    sol::object obj = impl_->view->globals().raw_get<sol::object>(name);
    auto marshaled = to_host(obj);
    if (!marshaled) {
        return std::nullopt;
    }
    return std::move(marshaled.value);
}

sol::state_view& LuaState::state() {
    return *impl_->view;
}

const sol::state_view& LuaState::state() const {
    return *impl_->view;
}

lua_State* LuaState::lua_state() {
    return impl_->L.get();
}

std::size_t LuaState::memory_used() const {
    if (impl_->memTracker) {
        return impl_->memTracker->allocated.load();
    }
    // Fallback: use Lua's internal count
    return static_cast<std::size_t>(lua_gc(impl_->L.get(), LUA_GCCOUNT, 0)) * 1024 +
           static_cast<std::size_t>(lua_gc(impl_->L.get(), LUA_GCCOUNTB, 0));
}

bool LuaState::memory_limited() const {
    return impl_->memTracker && impl_->memTracker->limit > 0;
}

bool LuaState::budget_exceeded() const {
    return impl_->execLimiter && impl_->execLimiter->exceeded;
}

void LuaState::reset() {
    bool wasSandboxed = sandboxed_;
    ScriptLimits savedLimits = limits_;

    impl_ = std::make_unique<Impl>();
    if (!impl_->create(memoryLimit_)) {
        throw EngineFatalError("failed to recreate Lua state");
    }
    impl_->open_default_libraries();

    sandboxed_ = false;
    if (wasSandboxed) {
        apply_sandbox(savedLimits);
    }
}

std::optional<sol::protected_function> resolve_function(sol::state_view& lua, const std::string& dottedPath,
                                                         std::string* why) {
    auto miss = [why](const std::string& reason) {
        if (why) *why = reason;
    };

    const auto parts = split_path(dottedPath);
    for (const auto& part : parts) {
        if (part.empty()) {
            miss("invalid function path '" + dottedPath + "'");
            return std::nullopt;
        }
    }

    // Raw lookups: resolving a path never runs guest metamethods.
    sol::object current = lua.globals().raw_get<sol::object>(parts[0]);
    std::string walked = parts[0];

    for (std::size_t i = 1; i < parts.size(); ++i) {
        if (current.get_type() == sol::type::lua_nil || current.get_type() == sol::type::none) {
            miss(walked + " is nil");
            return std::nullopt;
        }
        if (current.get_type() != sol::type::table) {
            miss(walked + " is not a table");
            return std::nullopt;
        }
        sol::table table = current.as<sol::table>();
        current = table.raw_get<sol::object>(parts[i]);
        walked += "." + parts[i];
    }

    if (current.get_type() != sol::type::function) {
        miss(dottedPath + " is not a function");
        return std::nullopt;
    }

    return current.as<sol::protected_function>();
}

std::unique_ptr<LuaState> create_sandboxed_state(const ScriptLimits& limits) {
    auto state = std::make_unique<LuaState>();
    if (!state->init(limits.maxMemoryBytes)) {
        return nullptr;
    }
    state->apply_sandbox(limits);
    return state;
}

} // namespace playscript::scripting
