// test_patch.cpp - Tests for JSON Patch application

#include <catch2/catch_all.hpp>
#include <json_delta/patch.h>
#include <json_delta/serialization.h>

#include <string>

using namespace json_delta;

namespace {

Value json(std::string_view text)
{
    std::string error;
    Value v = from_json(text, &error);
    REQUIRE(error.empty());
    return v;
}

const PointerError& pointer_error(const PatchResult& result)
{
    REQUIRE(result.error.has_value());
    REQUIRE(std::holds_alternative<PointerError>(result.error->error));
    return std::get<PointerError>(result.error->error);
}

} // namespace

// ============================================================
// Individual operations
// ============================================================

TEST_CASE("add operation", "[patch][add]") {
    Value doc = json(R"({"foo": "bar"})");

    auto r = apply(Patch{AddOp{Pointer{"baz"}, Value{"qux"}}}, doc);
    REQUIRE(r.get() == json(R"({"foo": "bar", "baz": "qux"})"));

    SECTION("into an array") {
        auto arr = apply(Patch{AddOp{Pointer{"a", "1"}, Value{"x"}}}, json(R"({"a": ["p", "q"]})"));
        REQUIRE(arr.get() == json(R"({"a": ["p", "x", "q"]})"));
    }

    SECTION("whole document") {
        auto root = apply(Patch{AddOp{Pointer{}, Value{"x"}}}, doc);
        REQUIRE(root.get() == Value{"x"});
    }
}

TEST_CASE("remove operation", "[patch][remove]") {
    auto r = apply(Patch{RemoveOp{Pointer{"a", "1"}}}, json(R"({"a": [1, 2, 3]})"));
    REQUIRE(r.get() == json(R"({"a": [1, 3]})"));

    SECTION("missing target fails") {
        auto bad = apply(Patch{RemoveOp{Pointer{"nope"}}}, json("{}"));
        REQUIRE(pointer_error(bad).code == PointerErrorCode::FieldNotFound);
    }
}

TEST_CASE("replace operation", "[patch][replace]") {
    SECTION("object member") {
        auto r = apply(Patch{ReplaceOp{Pointer{"a"}, Value{9}}}, json(R"({"a": 1, "b": 2})"));
        REQUIRE(r.get() == json(R"({"a": 9, "b": 2})"));
    }

    SECTION("array element keeps its position") {
        auto r = apply(Patch{ReplaceOp{Pointer{"1"}, Value{"x"}}}, json(R"([1, 2, 3])"));
        REQUIRE(r.get() == json(R"([1, "x", 3])"));
    }

    SECTION("target must exist") {
        auto r = apply(Patch{ReplaceOp{Pointer{"missing"}, Value{1}}}, json("{}"));
        REQUIRE(pointer_error(r).code == PointerErrorCode::FieldNotFound);
    }

    SECTION("root") {
        auto r = apply(Patch{ReplaceOp{Pointer{}, json("[1]")}}, json(R"({"a": 1})"));
        REQUIRE(r.get() == json("[1]"));
    }
}

TEST_CASE("move operation", "[patch][move]") {
    SECTION("between object members") {
        auto r = apply(Patch{MoveOp{Pointer{"foo", "waldo"}, Pointer{"qux", "thud"}}},
                       json(R"({"foo": {"bar": "baz", "waldo": "fred"}, "qux": {"corge": "grault"}})"));
        REQUIRE(r.get() == json(R"({"foo": {"bar": "baz"}, "qux": {"corge": "grault", "thud": "fred"}})"));
    }

    SECTION("within an array, target index is read after the removal") {
        auto r = apply(Patch{MoveOp{Pointer{"foo", "1"}, Pointer{"foo", "3"}}},
                       json(R"({"foo": ["all", "grass", "cows", "eat"]})"));
        REQUIRE(r.get() == json(R"({"foo": ["all", "cows", "eat", "grass"]})"));
    }

    SECTION("missing source fails") {
        auto r = apply(Patch{MoveOp{Pointer{"x"}, Pointer{"y"}}}, json("{}"));
        REQUIRE(pointer_error(r).code == PointerErrorCode::FieldNotFound);
    }

    SECTION("into its own child fails after the removal") {
        auto r = apply(Patch{MoveOp{Pointer{"a"}, Pointer{"a", "b"}}}, json(R"({"a": {}})"));
        REQUIRE(pointer_error(r).code == PointerErrorCode::FieldNotFound);
    }
}

TEST_CASE("copy operation", "[patch][copy]") {
    auto r = apply(Patch{CopyOp{Pointer{"a"}, Pointer{"b"}}}, json(R"({"a": [1, 2]})"));
    REQUIRE(r.get() == json(R"({"a": [1, 2], "b": [1, 2]})"));

    SECTION("append to an array") {
        auto arr = apply(Patch{CopyOp{Pointer{"0"}, Pointer{"-"}}}, json(R"([{"k": 1}])"));
        REQUIRE(arr.get() == json(R"([{"k": 1}, {"k": 1}])"));
    }
}

TEST_CASE("test operation", "[patch][test]") {
    Value doc = json(R"({"a": 5, "b": [1, {"c": "d"}]})");

    SECTION("success leaves the document unchanged") {
        auto r = apply(Patch{TestOp{Pointer{"b"}, json(R"([1.0, {"c": "d"}])")}}, doc);
        REQUIRE(r);
        REQUIRE(r.value == doc);
    }

    SECTION("mismatch reports expected and actual") {
        auto r = apply(Patch{TestOp{Pointer{"a"}, Value{6}}}, doc);
        REQUIRE_FALSE(r);
        REQUIRE(r.error->index == 0);
        REQUIRE(std::holds_alternative<TestFailed>(r.error->error));
        const auto& failure = std::get<TestFailed>(r.error->error);
        REQUIRE(failure == TestFailed{Pointer{"a"}, Value{6}, Value{5}});
    }

    SECTION("missing path is a pointer error, not a test failure") {
        auto r = apply(Patch{TestOp{Pointer{"zzz"}, Value{1}}}, doc);
        REQUIRE(pointer_error(r).code == PointerErrorCode::FieldNotFound);
    }
}

// ============================================================
// Sequencing
// ============================================================

TEST_CASE("apply stops at the first failure", "[patch][apply]") {
    Value doc = json(R"({"a": [1, 2]})");
    Patch patch{
        AddOp{Pointer{"b"}, Value{true}},
        RemoveOp{Pointer{"a", "5"}},
        AddOp{Pointer{"c"}, Value{3}},
    };

    auto r = apply(patch, doc);
    REQUIRE_FALSE(r);
    REQUIRE(r.value.is_null());
    REQUIRE(r.error->index == 1);
    REQUIRE(r.error->operation == patch[1]);
    REQUIRE(pointer_error(r).code == PointerErrorCode::IndexOutOfBounds);
    REQUIRE(r.get_or(doc) == doc);
    REQUIRE_THROWS_AS(r.get(), std::runtime_error);

    // Input is unchanged
    REQUIRE(doc == json(R"({"a": [1, 2]})"));
}

TEST_CASE("operations see the results of earlier ones", "[patch][apply]") {
    Patch patch{
        AddOp{Pointer{"list"}, json("[]")},
        AddOp{Pointer{"list", "-"}, Value{1}},
        AddOp{Pointer{"list", "-"}, Value{2}},
        CopyOp{Pointer{"list"}, Pointer{"copy"}},
        ReplaceOp{Pointer{"list", "0"}, Value{"first"}},
        TestOp{Pointer{"copy", "0"}, Value{1}},
        MoveOp{Pointer{"copy"}, Pointer{"moved"}},
    };

    auto r = apply(patch, json("{}"));
    REQUIRE(r.get() == json(R"({"list": ["first", 2], "moved": [1, 2]})"));
}

TEST_CASE("empty patch returns the input", "[patch][apply]") {
    Value doc = json(R"({"a": 1})");
    REQUIRE(apply(Patch{}, doc).get() == doc);
}

TEST_CASE("apply_operation", "[patch][apply]") {
    auto r = apply_operation(RemoveOp{Pointer{"a"}}, json(R"({"a": 1})"));
    REQUIRE(r.get() == json("{}"));

    auto bad = apply_operation(TestOp{Pointer{}, Value{1}}, Value{2});
    REQUIRE_FALSE(bad);
    REQUIRE(std::holds_alternative<TestFailed>(*bad.error));
}

// ============================================================
// Rendering
// ============================================================

TEST_CASE("operation rendering", "[patch][string]") {
    REQUIRE(operation_name(CopyOp{}) == "copy");
    REQUIRE(path_of(MoveOp{Pointer{"a"}, Pointer{"b"}}) == Pointer{"b"});
    REQUIRE(to_string(Operation{MoveOp{Pointer{"a", "0"}, Pointer{"b"}}}) == R"(move "/a/0" -> "/b")");
    REQUIRE(to_string(Operation{AddOp{Pointer{"x"}, json(R"({"k":1})")}}) == R"(add "/x" = {"k":1})");
    REQUIRE(to_string(Operation{RemoveOp{Pointer{}}}) == R"(remove "")");
}

TEST_CASE("error_to_string", "[patch][string]") {
    SECTION("pointer error") {
        auto r = apply(Patch{TestOp{Pointer{"a"}, Value{1}}, RemoveOp{Pointer{"a", "5"}}},
                       json(R"({"a": 1})"));
        REQUIRE_FALSE(r);
        REQUIRE(error_to_string(*r.error) ==
                R"(operation 1 (remove "/a/5") failed: type mismatch at "5": cannot resolve a segment against number)");
    }

    SECTION("test failure") {
        auto r = apply(Patch{TestOp{Pointer{"a"}, Value{6}}}, json(R"({"a": 5})"));
        REQUIRE(error_to_string(*r.error) ==
                R"(operation 0 (test "/a" = 6) failed: test failed at "/a": expected 6, found 5)");
    }
}
