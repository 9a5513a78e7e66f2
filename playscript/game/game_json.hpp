#pragma once

// JSON bridge for the structured types that leave the scripting core:
// GameState persistence, metadata.json and the stored game artifacts.

#include "game_metadata.hpp"
#include "game_state.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace playscript::game {

using json = nlohmann::json;

json script_value_to_json(const ScriptValue& value);
ScriptValue script_value_from_json(const json& j);

json game_state_to_json(const GameState& state);
bool game_state_from_json(const json& j, GameState* out, std::string* err);

json metadata_to_json(const GameMetadata& meta);

// Lenient: missing or mistyped fields keep their defaults. Fails only when
// the document is not an object.
bool metadata_from_json(const json& j, GameMetadata* out, std::string* err);
bool read_metadata_json(const std::string& text, GameMetadata* out, std::string* err);

// {"id": "...", "metadata": {...}, "logicLua": "..."}; logicLua is required.
bool read_artifacts_json(const std::string& text, GameArtifacts* out, std::string* err);

} // namespace playscript::game
