#include "script_value.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace playscript::scripting {

namespace {

std::string format_number(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.14g", v);
    return buf;
}

} // namespace

const char* ScriptValue::type_name() const {
    switch (type()) {
        case Type::Nil: return "nil";
        case Type::Boolean: return "boolean";
        case Type::Integer: return "integer";
        case Type::Number: return "number";
        case Type::String: return "string";
        case Type::Sequence: return "sequence";
        case Type::Record: return "record";
        default: return "unknown";
    }
}

std::int64_t ScriptValue::as_integer() const {
    if (type() == Type::Number) {
        return static_cast<std::int64_t>(std::get<double>(data_));
    }
    return std::get<std::int64_t>(data_);
}

double ScriptValue::as_number() const {
    if (type() == Type::Integer) {
        return static_cast<double>(std::get<std::int64_t>(data_));
    }
    return std::get<double>(data_);
}

const ScriptValue* ScriptValue::find(const std::string& key) const {
    if (!is_record()) return nullptr;

    const auto& rec = std::get<Record>(data_);
    auto it = rec.find(key);
    if (it == rec.end()) return nullptr;
    return &it->second;
}

std::string ScriptValue::to_display_string() const {
    switch (type()) {
        case Type::Nil: return "nil";
        case Type::Boolean: return as_bool() ? "true" : "false";
        case Type::Integer: return std::to_string(std::get<std::int64_t>(data_));
        case Type::Number: return format_number(std::get<double>(data_));
        case Type::String: return as_string();
        case Type::Sequence: {
            std::ostringstream oss;
            oss << "{";
            bool first = true;
            for (const auto& v : as_sequence()) {
                if (!first) oss << ", ";
                first = false;
                oss << (v.is_string() ? "\"" + v.as_string() + "\"" : v.to_display_string());
            }
            oss << "}";
            return oss.str();
        }
        case Type::Record: {
            std::ostringstream oss;
            oss << "{";
            bool first = true;
            for (const auto& [k, v] : as_record()) {
                if (!first) oss << ", ";
                first = false;
                oss << k << " = " << (v.is_string() ? "\"" + v.as_string() + "\"" : v.to_display_string());
            }
            oss << "}";
            return oss.str();
        }
        default:
            return "?";
    }
}

bool operator==(const ScriptValue& a, const ScriptValue& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_integer() && b.is_integer()) {
            return a.as_integer() == b.as_integer();
        }
        return a.as_number() == b.as_number();
    }
    return a.data_ == b.data_;
}

} // namespace playscript::scripting
