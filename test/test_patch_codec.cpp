// test_patch_codec.cpp - Tests for Pointer/Patch JSON encoding

#include <catch2/catch_all.hpp>
#include <json_delta/patch_codec.h>
#include <json_delta/serialization.h>

#include <string>

using namespace json_delta;

TEST_CASE("encode/decode pointer", "[codec][pointer]") {
    SECTION("encodes to the escaped string form") {
        REQUIRE(encode_pointer(Pointer{"a/b", "c~d"}) == Value{"/a~1b/c~0d"});
        REQUIRE(encode_pointer(Pointer{}) == Value{""});
    }

    SECTION("decode of encode is the identity") {
        Pointer p{"", "~1", "x/y", "-"};
        auto decoded = decode_pointer(encode_pointer(p));
        REQUIRE(decoded);
        REQUIRE(decoded.value == p);
    }

    SECTION("non-string fails") {
        auto decoded = decode_pointer(Value{3});
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error->find("number") != std::string::npos);
    }

    SECTION("string without leading slash fails") {
        REQUIRE_FALSE(decode_pointer(Value{"abc"}));
    }
}

TEST_CASE("encode_operation field layout", "[codec][operation]") {
    SECTION("value operations") {
        Value v = encode_operation(ReplaceOp{Pointer{"a"}, Value{1}});
        REQUIRE(v == from_json(R"({"op": "replace", "path": "/a", "value": 1})"));
    }

    SECTION("remove has no value") {
        Value v = encode_operation(RemoveOp{Pointer{"a", "0"}});
        REQUIRE(v == from_json(R"({"op": "remove", "path": "/a/0"})"));
    }

    SECTION("move and copy carry from") {
        Value v = encode_operation(CopyOp{Pointer{"x"}, Pointer{"y"}});
        REQUIRE(v == from_json(R"({"op": "copy", "from": "/x", "path": "/y"})"));
    }
}

TEST_CASE("decode_patch", "[codec][patch]") {
    SECTION("all six operations") {
        auto r = parse_patch(R"([
            {"op": "test",    "path": "/a/b/c", "value": "foo"},
            {"op": "remove",  "path": "/a/b/c"},
            {"op": "add",     "path": "/a/b/c", "value": ["foo", "bar"]},
            {"op": "replace", "path": "/a/b/c", "value": 42},
            {"op": "move",    "from": "/a/b/c", "path": "/a/b/d"},
            {"op": "copy",    "from": "/a/b/d", "path": "/a/b/e"}
        ])");
        REQUIRE(r);

        const Pointer abc{"a", "b", "c"};
        Patch expected{
            TestOp{abc, Value{"foo"}},
            RemoveOp{abc},
            AddOp{abc, Value::array({Value{"foo"}, Value{"bar"}})},
            ReplaceOp{abc, Value{42}},
            MoveOp{abc, Pointer{"a", "b", "d"}},
            CopyOp{Pointer{"a", "b", "d"}, Pointer{"a", "b", "e"}},
        };
        REQUIRE(r.value == expected);
    }

    SECTION("extra members are ignored") {
        auto r = parse_patch(R"([{"op": "remove", "path": "/a", "value": 1, "note": "x"}])");
        REQUIRE(r);
        REQUIRE(r.value == Patch{RemoveOp{Pointer{"a"}}});
    }

    SECTION("null value is a value") {
        auto r = parse_patch(R"([{"op": "add", "path": "/a", "value": null}])");
        REQUIRE(r);
        REQUIRE(r.value == Patch{AddOp{Pointer{"a"}, Value{}}});
    }

    SECTION("unknown op names the op") {
        auto r = parse_patch(R"([{"op": "frobnicate", "path": "/a"}])");
        REQUIRE_FALSE(r);
        REQUIRE(*r.error == "operation 0: unknown operation 'frobnicate'");
    }

    SECTION("missing member names the member and index") {
        auto r = parse_patch(R"([{"op": "remove", "path": "/a"}, {"op": "add", "path": "/a"}])");
        REQUIRE_FALSE(r);
        REQUIRE(*r.error == "operation 1: missing field 'value'");
    }

    SECTION("missing from") {
        auto r = parse_patch(R"([{"op": "move", "path": "/a"}])");
        REQUIRE(*r.error == "operation 0: missing field 'from'");
    }

    SECTION("missing op") {
        auto r = parse_patch(R"([{"path": "/a"}])");
        REQUIRE(*r.error == "operation 0: missing field 'op'");
    }

    SECTION("bad pointer text") {
        auto r = parse_patch(R"([{"op": "remove", "path": "a"}])");
        REQUIRE_FALSE(r);
        REQUIRE(r.error->starts_with("operation 0: field 'path': "));
    }

    SECTION("patch must be an array") {
        REQUIRE_FALSE(decode_patch(from_json(R"({"op": "remove"})")));
        REQUIRE_FALSE(decode_patch(Value{}));
    }

    SECTION("operation must be an object") {
        auto r = parse_patch("[1]");
        REQUIRE(*r.error == "operation 0: operation must be an object, got number");
    }

    SECTION("invalid JSON text") {
        auto r = parse_patch("[{");
        REQUIRE_FALSE(r);
        REQUIRE(r.error->starts_with("invalid JSON: "));
    }

    SECTION("empty array is an empty patch") {
        auto r = parse_patch("[]");
        REQUIRE(r);
        REQUIRE(r.value.empty());
    }
}

TEST_CASE("patch survives encode then decode", "[codec][patch][roundtrip]") {
    Patch patch{
        AddOp{Pointer{"a~b", "-"}, from_json(R"({"nested": [1, "two", null, false]})")},
        RemoveOp{Pointer{"x/y"}},
        ReplaceOp{Pointer{}, Value{1.5}},
        MoveOp{Pointer{"0"}, Pointer{""}},
        CopyOp{Pointer{"p"}, Pointer{"q"}},
        TestOp{Pointer{"t"}, Value{"s"}},
        TestOp{Pointer{"sum"}, Value{0.1 + 0.2}},
        AddOp{Pointer{"third"}, Value{1.0 / 3}},
    };

    Value encoded = encode_patch(patch);
    REQUIRE(encoded.size() == patch.size());

    auto decoded = decode_patch(encoded);
    REQUIRE(decoded);
    REQUIRE(decoded.value == patch);

    SECTION("through JSON text too") {
        auto reparsed = parse_patch(to_json(encoded));
        REQUIRE(reparsed);
        REQUIRE(reparsed.value == patch);
        REQUIRE(std::get<TestOp>(reparsed.value[6]).value.as_number() == 0.1 + 0.2);
        REQUIRE(std::get<AddOp>(reparsed.value[7]).value.as_number() == 1.0 / 3);
    }
}
