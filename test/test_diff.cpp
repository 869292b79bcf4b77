// test_diff.cpp - Tests for diff()

#include "test_helpers.h"

#include <treepatch/equality.h>
#include <treepatch/patch.h>
#include <treepatch/value_diff.h>

#include <string>
#include <utility>
#include <vector>

using namespace treepatch;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value create_state_v1() {
    return json(R"({
        "name": "Alice",
        "age": 30,
        "items": [1, 2, 3],
        "profile": {"city": "Beijing", "tags": ["a", "b"]}
    })");
}

Value create_state_v2() {
    return json(R"({
        "name": "Bob",
        "age": 30,
        "items": [1, 2, 4],
        "profile": {"city": "Beijing", "tags": ["a"]},
        "email": "bob@test.com"
    })");
}

void require_round_trip(const Value& a, const Value& b) {
    auto ops = diff(a, b);
    INFO("diff: " << to_json(operations_to_value(ops), true));
    auto result = patch(a, ops);
    INFO("error: " << result.error_message);
    REQUIRE(result);
    REQUIRE(considered_equal(result.value, b));
}

} // anonymous namespace

// ============================================================
// Operation shape
// ============================================================

TEST_CASE("diff of equal values is empty", "[diff]") {
    auto v = create_state_v1();
    REQUIRE(diff(v, v).empty());
    REQUIRE(diff(v, create_state_v1()).empty());
    REQUIRE(diff(Value{}, Value{}).empty());
    REQUIRE(diff(json("[]"), json("[]")).empty());
}

TEST_CASE("diff of scalars is a single replace", "[diff]") {
    auto ops = diff(Value{1}, Value{2});
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0] == PatchOp::replace({}, Value{2}));

    SECTION("number representation counts as a change") {
        REQUIRE(diff(Value{1}, Value{1.0}).size() == 1);
    }
}

TEST_CASE("diff of objects", "[diff]") {
    SECTION("additions last-to-first, then member edits last-to-first") {
        auto ops = diff(json(R"({"a":1,"b":2,"c":3})"), json(R"({"a":1,"c":4,"d":5,"e":6})"));

        std::vector<PatchOp> expected{
            PatchOp::add({"e"}, Value{6}),
            PatchOp::add({"d"}, Value{5}),
            PatchOp::replace({"c"}, Value{4}),
            PatchOp::remove({"b"}),
        };
        REQUIRE(ops == expected);
    }

    SECTION("nested edits follow their member") {
        auto ops = diff(json(R"({"x":{"p":1,"q":2},"y":1})"), json(R"({"x":{"p":3},"y":2})"));

        std::vector<PatchOp> expected{
            PatchOp::replace({"y"}, Value{2}),
            PatchOp::remove({"x", "q"}),
            PatchOp::replace({"x", "p"}, Value{3}),
        };
        REQUIRE(ops == expected);
    }
}

TEST_CASE("diff of arrays", "[diff]") {
    SECTION("changed element") {
        auto ops = diff(json("[1,2,3]"), json("[1,5,3]"));
        REQUIRE(ops == std::vector<PatchOp>{PatchOp::replace({"1"}, Value{5})});
    }

    SECTION("appended elements in ascending order") {
        auto ops = diff(json("[1]"), json("[1,2,3]"));
        std::vector<PatchOp> expected{
            PatchOp::add({"1"}, Value{2}),
            PatchOp::add({"2"}, Value{3}),
        };
        REQUIRE(ops == expected);
    }

    SECTION("surplus elements removed at the first surplus index") {
        auto ops = diff(json("[1,2,3,4]"), json("[1]"));
        std::vector<PatchOp> expected{
            PatchOp::remove({"1"}),
            PatchOp::remove({"1"}),
            PatchOp::remove({"1"}),
        };
        REQUIRE(ops == expected);
    }
}

TEST_CASE("diff between empty and non-empty objects", "[diff]") {
    SECTION("from empty: whole replace") {
        auto ops = diff(json("{}"), json(R"({"a":1})"));
        REQUIRE(ops == std::vector<PatchOp>{PatchOp::replace({}, json(R"({"a":1})"))});
    }

    SECTION("from null: whole replace") {
        auto ops = diff(Value{}, json(R"({"a":1})"));
        REQUIRE(ops == std::vector<PatchOp>{PatchOp::replace({}, json(R"({"a":1})"))});
    }

    SECTION("to empty: member removals, last member first") {
        auto ops = diff(json(R"({"a":1,"b":2})"), json("[]"));
        std::vector<PatchOp> expected{PatchOp::remove({"b"}), PatchOp::remove({"a"})};
        REQUIRE(ops == expected);
    }

    SECTION("to empty with index-like keys: whole replace") {
        auto ops = diff(json(R"({"a":1,"0":"x","1":"y"})"), json("[]"));
        REQUIRE(ops == std::vector<PatchOp>{PatchOp::replace({}, json("[]"))});
    }
}

TEST_CASE("diff paths are escaped tokens", "[diff]") {
    auto ops = diff(json(R"({"a/b":{"m~n":1}})"), json(R"({"a/b":{"m~n":2}})"));
    REQUIRE(ops.size() == 1);
    REQUIRE(compose_pointer(ops[0].path) == "/a~1b/m~0n");
}

// ============================================================
// Round trips
// ============================================================

TEST_CASE("diff round trip", "[diff][roundtrip]") {
    std::vector<std::pair<const char*, const char*>> cases{
        {R"({"a":1})", R"({"a":2})"},
        {R"({"a":1,"b":[1,2,3]})", R"({"b":[3],"c":{"d":null}})"},
        {R"([1,2,3,4,5])", R"([5])"},
        {R"([])", R"([1,2,3])"},
        {R"([[1,2],[3]])", R"([[1],[3,4,5],[6]])"},
        {R"({"x":{"y":{"z":[1,{"q":true}]}}})", R"({"x":{"y":{"z":[1,{"q":false,"r":"s"}]}}})"},
        {R"({"a":"0"})", R"({"a":{"b":1}})"},
        {R"({"a":{"b":1}})", R"({"a":0})"},
        {R"({"a":[1,2]})", R"({"a":{"k":1}})"},
        {R"({"0":"a","x":1})", R"({"0":"a","1":"b"})"},
        {R"({"0":"a","y":1})", R"({"0":"a","2":"c","x":2})"},
        {R"(1)", R"({"a":1})"},
        {R"("x")", R"([1])"},
        {R"({"a":[]})", R"({"a":{}})"},
        {R"({"a":1,"0":"x","1":"y"})", R"([])"},
        {R"({"1":"y","0":"x","a":1})", R"([])"},
        {R"({"k":{"a":1,"0":"x","1":"y"}})", R"({"k":[]})"},
    };

    for (const auto& [a, b] : cases) {
        INFO(a << " -> " << b);
        require_round_trip(json(a), json(b));
        require_round_trip(json(b), json(a));
    }

    SECTION("state snapshots") {
        require_round_trip(create_state_v1(), create_state_v2());
        require_round_trip(create_state_v2(), create_state_v1());
    }
}

TEST_CASE("diff reverse round trip", "[diff][roundtrip]") {
    // The operations of diff(b, a) applied to b last-first still give a,
    // as long as no array grows by more than one element.
    std::vector<std::pair<const char*, const char*>> cases{
        {R"({"a":1,"b":2})", R"({"a":3,"c":4})"},
        {R"([1])", R"([1,2,3,4])"},
        {R"([1,2])", R"([1,2,3])"},
        {R"([1,2,3])", R"([1,2])"},
        {R"({"x":[1,{"a":1}]})", R"({"x":[2,{"b":2}]})"},
    };

    for (const auto& [a_text, b_text] : cases) {
        INFO(a_text << " <- " << b_text);
        auto a = json(a_text);
        auto b = json(b_text);
        auto result = patch(b, reverse_operations(diff(b, a)));
        INFO("error: " << result.error_message);
        REQUIRE(result);
        REQUIRE(considered_equal(result.value, a));
    }
}

TEST_CASE("diff of deep trees replaces beyond the depth limit", "[diff][limits]") {
    Value a{1};
    Value b{2};
    for (int i = 0; i < TREEPATCH_MAX_DEPTH + 10; ++i) {
        a = Value::map({{"k", a}});
        b = Value::map({{"k", b}});
    }
    auto ops = diff(a, b);
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].kind == OpKind::Replace);
    REQUIRE(ops[0].path.size() == TREEPATCH_MAX_DEPTH);

    auto result = patch(a, ops);
    REQUIRE(result);
    REQUIRE(result.value == b);
}
