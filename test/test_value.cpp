// test_value.cpp - Tests for Value construction, accessors and builders

#include <catch2/catch_all.hpp>
#include <json_delta/builders.h>
#include <json_delta/value.h>

#include <sstream>
#include <string>

using namespace json_delta;

// ============================================================
// Construction
// ============================================================

TEST_CASE("Value scalar construction", "[value][construct]") {
    SECTION("default is null") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE(v.type() == ValueType::Null);
    }

    SECTION("nullptr is null") {
        REQUIRE(Value{nullptr}.is_null());
    }

    SECTION("bool") {
        Value v{true};
        REQUIRE(v.is_bool());
        REQUIRE(v.as_bool() == true);
    }

    SECTION("integers are stored as numbers") {
        Value v{42};
        REQUIRE(v.is_number());
        REQUIRE(v.as_number() == 42.0);
        REQUIRE(Value{42} == Value{42.0});
    }

    SECTION("strings") {
        REQUIRE(Value{"abc"}.as_string() == "abc");
        REQUIRE(Value{std::string{"abc"}}.is_string());
        REQUIRE(Value{std::string_view{"abc"}}.as_string_view() == "abc");
    }
}

TEST_CASE("Value container factories", "[value][construct]") {
    Value obj = Value::object({
        {"name", Value{"Alice"}},
        {"tags", Value::array({Value{"a"}, Value{"b"}})},
    });

    REQUIRE(obj.is_object());
    REQUIRE(obj.size() == 2);
    REQUIRE(obj.contains("name"));
    REQUIRE_FALSE(obj.contains("missing"));
    REQUIRE(obj.at("tags").is_array());
    REQUIRE(obj.at("tags").at(1).as_string() == "b");
}

// ============================================================
// Accessors
// ============================================================

TEST_CASE("Value accessors on a miss return null", "[value][access]") {
    Value arr = Value::array({Value{1}, Value{2}});

    REQUIRE(arr.at(5).is_null());
    REQUIRE(arr.at("key").is_null());
    REQUIRE(Value{3}.at(0).is_null());
    REQUIRE(arr.at_or("key", Value{"fallback"}).as_string() == "fallback");
    REQUIRE(Value{"text"}.as_number(-1.0) == -1.0);
}

TEST_CASE("Value::set returns a new value", "[value][set]") {
    Value original = Value::object({{"a", Value{1}}});

    Value updated = original.set("b", Value{2});
    REQUIRE(updated.size() == 2);
    REQUIRE(original.size() == 1);

    SECTION("set on a scalar is a no-op") {
        Value scalar{5};
        REQUIRE(scalar.set("x", Value{1}) == scalar);
    }

    SECTION("index past the end is a no-op") {
        Value arr = Value::array({Value{1}});
        REQUIRE(arr.set(std::size_t{3}, Value{9}) == arr);
        REQUIRE(arr.set(std::size_t{0}, Value{9}).at(0).as_number() == 9.0);
    }
}

TEST_CASE("type_name and value_to_string", "[value][utility]") {
    REQUIRE(type_name(ValueType::Object) == "object");
    REQUIRE(type_name(ValueType::Number) == "number");
    REQUIRE(value_to_string(Value{"x"}) == "\"x\"");
    REQUIRE(value_to_string(Value::array({Value{1}, Value{2}})) == "[array:2]");
    REQUIRE(value_to_string(Value{}) == "null");
}

TEST_CASE("operator<< writes compact JSON", "[value][utility]") {
    std::ostringstream oss;
    oss << Value::array({Value{1}, Value{"two"}, Value{}});
    REQUIRE(oss.str() == R"([1,"two",null])");
}

// ============================================================
// Builders
// ============================================================

TEST_CASE("ObjectBuilder and ArrayBuilder", "[value][builder]") {
    SECTION("object") {
        Value v = ObjectBuilder()
            .set("op", "add")
            .set("path", "/a")
            .set("value", 1)
            .finish();
        REQUIRE(v.size() == 3);
        REQUIRE(v.at("op").as_string() == "add");
    }

    SECTION("later set overwrites") {
        ObjectBuilder builder;
        builder.set("k", 1).set("k", 2);
        REQUIRE(builder.size() == 1);
        REQUIRE(builder.finish().at("k").as_number() == 2.0);
    }

    SECTION("array keeps order") {
        Value v = ArrayBuilder().push_back(1).push_back("x").push_back(true).finish();
        REQUIRE(v.size() == 3);
        REQUIRE(v.at(1).as_string() == "x");
        REQUIRE(v.at(2).as_bool());
    }
}

TEST_CASE("UnsafeValue shares the interface", "[value][policy]") {
    UnsafeValue v = UnsafeObjectBuilder{}
        .set("list", UnsafeArrayBuilder{}.push_back(1).push_back(2).finish())
        .finish();

    REQUIRE(v.is_object());
    REQUIRE(v.at("list").size() == 2);
    REQUIRE(v.set("k", UnsafeValue{"x"}).size() == 2);
    REQUIRE(v == v);
}
