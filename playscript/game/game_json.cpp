#include "game_json.hpp"

#include <cstdint>
#include <limits>

namespace playscript::game {

namespace {

void set_err(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

} // namespace

json script_value_to_json(const ScriptValue& value) {
    switch (value.type()) {
        case ScriptValue::Type::Nil:
            return nullptr;
        case ScriptValue::Type::Boolean:
            return value.as_bool();
        case ScriptValue::Type::Integer:
            return value.as_integer();
        case ScriptValue::Type::Number:
            return value.as_number();
        case ScriptValue::Type::String:
            return value.as_string();
        case ScriptValue::Type::Sequence: {
            json arr = json::array();
            for (const auto& v : value.as_sequence()) {
                arr.push_back(script_value_to_json(v));
            }
            return arr;
        }
        case ScriptValue::Type::Record: {
            json obj = json::object();
            for (const auto& [k, v] : value.as_record()) {
                obj[k] = script_value_to_json(v);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

ScriptValue script_value_from_json(const json& j) {
    if (j.is_null()) return ScriptValue{};
    if (j.is_boolean()) return ScriptValue(j.get<bool>());
    if (j.is_number_unsigned()) {
        const auto u = j.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return ScriptValue(static_cast<std::int64_t>(u));
        }
        return ScriptValue(static_cast<double>(u));
    }
    if (j.is_number_integer()) return ScriptValue(j.get<std::int64_t>());
    if (j.is_number_float()) return ScriptValue(j.get<double>());
    if (j.is_string()) return ScriptValue(j.get<std::string>());

    if (j.is_array()) {
        ScriptValue::Sequence seq;
        seq.reserve(j.size());
        for (const auto& v : j) {
            seq.push_back(script_value_from_json(v));
        }
        return ScriptValue(std::move(seq));
    }

    if (j.is_object()) {
        ScriptValue::Record rec;
        for (auto it = j.begin(); it != j.end(); ++it) {
            rec.emplace(it.key(), script_value_from_json(it.value()));
        }
        return ScriptValue(std::move(rec));
    }

    // Binary values have no script form.
    return ScriptValue{};
}

json game_state_to_json(const GameState& state) {
    return script_value_to_json(state.to_value());
}

bool game_state_from_json(const json& j, GameState* out, std::string* err) {
    if (!out) {
        set_err(err, "null output state");
        return false;
    }
    if (!j.is_object()) {
        set_err(err, "game state is not an object");
        return false;
    }

    auto state = GameState::from_value(script_value_from_json(j));
    if (!state) {
        set_err(err, "game state is not a record");
        return false;
    }

    *out = std::move(*state);
    return true;
}

json metadata_to_json(const GameMetadata& meta) {
    json j;
    j["name"] = meta.name;
    j["description"] = meta.description;
    j["type"] = meta.type;
    j["duration"] = meta.duration;
    j["rules"] = meta.rules;
    j["version"] = meta.version;
    return j;
}

bool metadata_from_json(const json& j, GameMetadata* out, std::string* err) {
    if (!out) {
        set_err(err, "null output metadata");
        return false;
    }
    if (!j.is_object()) {
        set_err(err, "metadata is not an object");
        return false;
    }

    GameMetadata meta;
    if (j.contains("name") && j["name"].is_string())
        meta.name = j["name"].get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        meta.description = j["description"].get<std::string>();
    if (j.contains("type") && j["type"].is_string())
        meta.type = j["type"].get<std::string>();
    if (j.contains("duration") && j["duration"].is_number()) {
        const double d = j["duration"].get<double>();
        if (d >= 1.0 && d <= static_cast<double>(std::numeric_limits<int>::max()))
            meta.duration = static_cast<int>(d);
    }
    if (j.contains("rules") && j["rules"].is_array()) {
        meta.rules.clear();
        for (const auto& r : j["rules"]) {
            if (r.is_string()) meta.rules.push_back(r.get<std::string>());
        }
    }
    if (j.contains("version") && j["version"].is_string())
        meta.version = j["version"].get<std::string>();

    *out = std::move(meta);
    return true;
}

bool read_metadata_json(const std::string& text, GameMetadata* out, std::string* err) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        set_err(err, "metadata is not valid JSON");
        return false;
    }
    return metadata_from_json(j, out, err);
}

bool read_artifacts_json(const std::string& text, GameArtifacts* out, std::string* err) {
    if (!out) {
        set_err(err, "null output artifacts");
        return false;
    }

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        set_err(err, "artifacts are not valid JSON");
        return false;
    }
    if (!j.is_object()) {
        set_err(err, "artifacts document is not an object");
        return false;
    }

    if (!j.contains("logicLua") || !j["logicLua"].is_string()) {
        set_err(err, "artifacts missing 'logicLua' string");
        return false;
    }

    GameArtifacts artifacts;
    artifacts.logicLua = j["logicLua"].get<std::string>();

    if (j.contains("id") && j["id"].is_string())
        artifacts.id = j["id"].get<std::string>();

    if (j.contains("metadata")) {
        std::string metaErr;
        if (!metadata_from_json(j["metadata"], &artifacts.metadata, &metaErr)) {
            set_err(err, metaErr);
            return false;
        }
    }

    *out = std::move(artifacts);
    return true;
}

} // namespace playscript::game
