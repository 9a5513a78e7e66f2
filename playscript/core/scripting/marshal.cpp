#include "marshal.hpp"

#include <cmath>
#include <cstdio>
#include <utility>
#include <vector>

namespace playscript::scripting {

namespace {

constexpr double kInt64Min = -9223372036854775808.0;
constexpr double kInt64Max = 9223372036854775808.0;  // exclusive

bool is_integral_number(double v) {
    return std::isfinite(v) && std::floor(v) == v && v >= kInt64Min && v < kInt64Max;
}

ScriptValue number_to_value(double v) {
    if (is_integral_number(v)) {
        return ScriptValue(static_cast<std::int64_t>(v));
    }
    return ScriptValue(v);
}

MarshalResult to_host_impl(const sol::object& value, int depth);

MarshalResult table_to_host(const sol::table& table, int depth) {
    if (depth >= kMaxMarshalDepth) {
        return MarshalResult::fail("table nesting exceeds " + std::to_string(kMaxMarshalDepth) +
                                   " levels (cyclic table?)");
    }

    std::vector<std::pair<sol::object, sol::object>> entries;
    table.for_each([&entries](const sol::object& k, const sol::object& v) {
        entries.emplace_back(k, v);
    });

    if (entries.empty()) {
        return MarshalResult::ok(ScriptValue::Record{});
    }

    // Dense 1..N check: N distinct integral keys, all inside [1, N].
    const double n = static_cast<double>(entries.size());
    bool dense = true;
    for (const auto& [k, v] : entries) {
        if (k.get_type() != sol::type::number) {
            dense = false;
            break;
        }
        const double key = k.as<double>();
        if (!is_integral_number(key) || key < 1.0 || key > n) {
            dense = false;
            break;
        }
    }

    if (dense) {
        ScriptValue::Sequence seq(entries.size());
        for (const auto& [k, v] : entries) {
            const auto idx = static_cast<std::size_t>(k.as<double>()) - 1;
            auto converted = to_host_impl(v, depth + 1);
            if (!converted) {
                return MarshalResult::fail("at index " + std::to_string(idx + 1) + ": " + converted.error);
            }
            seq[idx] = std::move(converted.value);
        }
        return MarshalResult::ok(std::move(seq));
    }

    // Record: non-string keys first, so a genuine string key of the same
    // spelling always wins regardless of guest iteration order.
    ScriptValue::Record rec;
    std::vector<std::pair<std::string, const sol::object*>> stringKeyed;

    for (const auto& entry : entries) {
        const sol::object& k = entry.first;
        std::string key;

        switch (k.get_type()) {
            case sol::type::string:
                stringKeyed.emplace_back(k.as<std::string>(), &entry.second);
                continue;
            case sol::type::number:
                key = number_key_string(k.as<double>());
                break;
            case sol::type::boolean:
                key = k.as<bool>() ? "true" : "false";
                break;
            default:
                return MarshalResult::fail("unsupported table key type '" +
                                           sol::type_name(k.lua_state(), k.get_type()) + "'");
        }

        auto converted = to_host_impl(entry.second, depth + 1);
        if (!converted) {
            return MarshalResult::fail("at key '" + key + "': " + converted.error);
        }
        rec.insert_or_assign(std::move(key), std::move(converted.value));
    }

    for (auto& [key, v] : stringKeyed) {
        auto converted = to_host_impl(*v, depth + 1);
        if (!converted) {
            return MarshalResult::fail("at key '" + key + "': " + converted.error);
        }
        rec.insert_or_assign(std::move(key), std::move(converted.value));
    }

    return MarshalResult::ok(std::move(rec));
}

MarshalResult to_host_impl(const sol::object& value, int depth) {
    switch (value.get_type()) {
        case sol::type::none:
        case sol::type::lua_nil:
            return MarshalResult::ok(ScriptValue{});
        case sol::type::boolean:
            return MarshalResult::ok(ScriptValue(value.as<bool>()));
        case sol::type::number:
            return MarshalResult::ok(number_to_value(value.as<double>()));
        case sol::type::string:
            return MarshalResult::ok(ScriptValue(value.as<std::string>()));
        case sol::type::table:
            return table_to_host(value.as<sol::table>(), depth);
        default:
            return MarshalResult::fail("guest value of type '" +
                                       sol::type_name(value.lua_state(), value.get_type()) +
                                       "' has no host representation");
    }
}

} // namespace

std::string number_key_string(double key) {
    if (is_integral_number(key)) {
        return std::to_string(static_cast<long long>(key));
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.14g", key);
    return buf;
}

sol::object to_guest(sol::state_view lua, const ScriptValue& value) {
    switch (value.type()) {
        case ScriptValue::Type::Nil:
            return sol::make_object(lua, sol::lua_nil);
        case ScriptValue::Type::Boolean:
            return sol::make_object(lua, value.as_bool());
        case ScriptValue::Type::Integer:
            return sol::make_object(lua, value.as_integer());
        case ScriptValue::Type::Number:
            return sol::make_object(lua, value.as_number());
        case ScriptValue::Type::String:
            return sol::make_object(lua, value.as_string());
        case ScriptValue::Type::Sequence: {
            const auto& seq = value.as_sequence();
            sol::table t = lua.create_table(static_cast<int>(seq.size()), 0);
            for (std::size_t i = 0; i < seq.size(); ++i) {
                t.raw_set(i + 1, to_guest(lua, seq[i]));
            }
            return sol::object(std::move(t));
        }
        case ScriptValue::Type::Record: {
            const auto& rec = value.as_record();
            sol::table t = lua.create_table(0, static_cast<int>(rec.size()));
            for (const auto& [k, v] : rec) {
                t.raw_set(k, to_guest(lua, v));
            }
            return sol::object(std::move(t));
        }
        default:
            return sol::make_object(lua, sol::lua_nil);
    }
}

MarshalResult to_host(const sol::object& value) {
    return to_host_impl(value, 0);
}

} // namespace playscript::scripting
