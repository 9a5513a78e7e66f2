#pragma once

// Scripting core - sandboxed Lua for generated game logic
//
// This module provides:
// - LuaState: sol2/LuaJIT wrapper with sandbox, memory and instruction limits
// - Sandbox: static checks and factory for untrusted scripts
// - ScriptValue + marshal: host values and their Lua table mapping
//
// Usage:
//   auto lua = Sandbox::create(SandboxConfig::default_for_games());
//   if (lua && lua->execute(source, "logic.lua", "Game")) {
//       auto r = lua->call("Game.init");
//       if (r) { /* r.value is a ScriptValue */ }
//   }

#include "lua_state.hpp"
#include "marshal.hpp"
#include "sandbox.hpp"
#include "script_types.hpp"
#include "script_value.hpp"
