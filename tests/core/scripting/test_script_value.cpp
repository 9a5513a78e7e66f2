/**
 * @file test_script_value.cpp
 * @brief Unit tests for the host-side ScriptValue type.
 */

#include <catch2/catch_test_macros.hpp>

#include <playscript/core/scripting/script_value.hpp>

using namespace playscript::scripting;

// =============================================================================
// Construction and type queries
// =============================================================================

TEST_CASE("ScriptValue defaults to nil", "[scripting][value]") {
    ScriptValue v;
    REQUIRE(v.is_nil());
    REQUIRE(v.type() == ScriptValue::Type::Nil);
    REQUIRE(std::string(v.type_name()) == "nil");
}

TEST_CASE("ScriptValue picks the right alternative", "[scripting][value]") {
    SECTION("bool stays bool") {
        ScriptValue v(true);
        REQUIRE(v.is_boolean());
        REQUIRE(v.as_bool());
    }

    SECTION("integral types become integers") {
        REQUIRE(ScriptValue(42).is_integer());
        REQUIRE(ScriptValue(std::int64_t{-7}).as_integer() == -7);
        REQUIRE(ScriptValue(std::size_t{3}).as_integer() == 3);
    }

    SECTION("floating types become numbers") {
        ScriptValue v(1.5);
        REQUIRE(v.type() == ScriptValue::Type::Number);
        REQUIRE(v.is_number());
        REQUIRE_FALSE(v.is_integer());
        REQUIRE(v.as_number() == 1.5);
    }

    SECTION("string literals become strings") {
        ScriptValue v("héllo");
        REQUIRE(v.is_string());
        REQUIRE(v.as_string() == "héllo");
    }

    SECTION("nullptr is nil") {
        REQUIRE(ScriptValue(nullptr).is_nil());
    }
}

TEST_CASE("Numeric accessors accept either numeric alternative", "[scripting][value]") {
    REQUIRE(ScriptValue(3).as_number() == 3.0);
    REQUIRE(ScriptValue(3.0).as_integer() == 3);
}

// =============================================================================
// Equality
// =============================================================================

TEST_CASE("Integers and floats compare by value", "[scripting][value]") {
    REQUIRE(ScriptValue(2) == ScriptValue(2.0));
    REQUIRE(ScriptValue(2) != ScriptValue(2.5));
    REQUIRE(ScriptValue(1) != ScriptValue(true));
    REQUIRE(ScriptValue("1") != ScriptValue(1));
}

TEST_CASE("Records compare independent of insertion order", "[scripting][value]") {
    ScriptValue::Record a;
    a["x"] = 1;
    a["y"] = "two";

    ScriptValue::Record b;
    b["y"] = "two";
    b["x"] = 1.0;

    REQUIRE(ScriptValue(a) == ScriptValue(b));
}

TEST_CASE("Empty sequence and empty record are different host values", "[scripting][value]") {
    REQUIRE(ScriptValue(ScriptValue::Sequence{}) != ScriptValue(ScriptValue::Record{}));
}

// =============================================================================
// Lookup and display
// =============================================================================

TEST_CASE("find looks up record keys only", "[scripting][value]") {
    ScriptValue::Record rec;
    rec["score"] = 10;
    ScriptValue v(rec);

    REQUIRE(v.find("score") != nullptr);
    REQUIRE(v.find("score")->as_integer() == 10);
    REQUIRE(v.find("missing") == nullptr);
    REQUIRE(ScriptValue(5).find("score") == nullptr);
}

TEST_CASE("to_display_string renders scalars", "[scripting][value]") {
    REQUIRE(ScriptValue().to_display_string() == "nil");
    REQUIRE(ScriptValue(true).to_display_string() == "true");
    REQUIRE(ScriptValue(12).to_display_string() == "12");
    REQUIRE(ScriptValue("abc").to_display_string() == "abc");
}
