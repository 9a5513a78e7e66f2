#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace playscript::scripting {

// Host-side representation of every value that may cross the guest boundary.
//
// Records are string-keyed and ordered, so two records holding the same
// fields compare equal regardless of the guest's iteration order.
// Integer and floating numbers compare by value (2 == 2.0).
class ScriptValue {
public:
    using Sequence = std::vector<ScriptValue>;
    using Record = std::map<std::string, ScriptValue>;

    enum class Type : std::uint8_t {
        Nil = 0,
        Boolean,
        Integer,
        Number,
        String,
        Sequence,
        Record,
    };

    ScriptValue() = default;
    ScriptValue(std::nullptr_t) {}
    ScriptValue(bool b) : data_(b) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    ScriptValue(T v) : data_(static_cast<std::int64_t>(v)) {}

    ScriptValue(float v) : data_(static_cast<double>(v)) {}
    ScriptValue(double v) : data_(v) {}
    ScriptValue(const char* s) : data_(std::string(s ? s : "")) {}
    ScriptValue(std::string s) : data_(std::move(s)) {}
    ScriptValue(Sequence seq) : data_(std::move(seq)) {}
    ScriptValue(Record rec) : data_(std::move(rec)) {}

    Type type() const { return static_cast<Type>(data_.index()); }
    const char* type_name() const;

    bool is_nil() const { return type() == Type::Nil; }
    bool is_boolean() const { return type() == Type::Boolean; }
    bool is_integer() const { return type() == Type::Integer; }
    // True for both integer and floating numbers.
    bool is_number() const { return type() == Type::Integer || type() == Type::Number; }
    bool is_string() const { return type() == Type::String; }
    bool is_sequence() const { return type() == Type::Sequence; }
    bool is_record() const { return type() == Type::Record; }

    // Accessors throw std::bad_variant_access on a type mismatch; numeric
    // accessors accept either numeric alternative.
    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_integer() const;
    double as_number() const;
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Sequence& as_sequence() const { return std::get<Sequence>(data_); }
    Sequence& as_sequence() { return std::get<Sequence>(data_); }
    const Record& as_record() const { return std::get<Record>(data_); }
    Record& as_record() { return std::get<Record>(data_); }

    // Record lookup; nullptr when this is not a record or the key is absent.
    const ScriptValue* find(const std::string& key) const;

    // Lua-like rendering for logs and the console front end.
    std::string to_display_string() const;

    friend bool operator==(const ScriptValue& a, const ScriptValue& b);
    friend bool operator!=(const ScriptValue& a, const ScriptValue& b) { return !(a == b); }

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, Sequence, Record> data_{};
};

} // namespace playscript::scripting
