// test_resolver.cpp - Tests for get()

#include "test_helpers.h"

#include <treepatch/resolver.h>

using namespace treepatch;

TEST_CASE("get resolves pointers", "[resolver]") {
    auto doc = json(R"({
        "users": [{"name": "Alice"}, {"name": "Bob"}],
        "a/b": 1,
        "m~n": 2,
        "": 3,
        "map": {"0": "zero", "1": "one"}
    })");

    SECTION("root") {
        auto r = get(doc, "");
        REQUIRE(r);
        REQUIRE(r.value == doc);
    }

    SECTION("nested") {
        REQUIRE(get(doc, "/users/1/name").get().as_string() == "Bob");
        REQUIRE(get(doc, "/a~1b").get().as_int() == 1);
        REQUIRE(get(doc, "/m~0n").get().as_int() == 2);
        REQUIRE(get(doc, "/").get().as_int() == 3);
    }

    SECTION("array-like map is read by index") {
        REQUIRE(get(doc, "/map/1").get().as_string() == "one");
    }

    SECTION("absent members") {
        for (const char* p : {"/nope", "/users/2", "/users/01", "/users/-", "/users/0/name/x"}) {
            INFO(p);
            auto r = get(doc, p);
            REQUIRE_FALSE(r);
            REQUIRE(r.error_code == PatchErrorCode::PathNotFound);
        }
    }

    SECTION("malformed pointer") {
        auto r = get(doc, "users");
        REQUIRE_FALSE(r);
        REQUIRE(r.error_code == PatchErrorCode::MalformedPointer);
    }

    SECTION("get() on a failure throws, get_or() falls back") {
        auto r = get(doc, "/nope");
        REQUIRE_THROWS_AS(r.get(), std::runtime_error);
        REQUIRE(r.get_or(Value{7}).as_int() == 7);
    }
}

TEST_CASE("get rejects over-long pointers", "[resolver][limits]") {
    Tokens tokens(TREEPATCH_MAX_DEPTH + 1, "a");
    auto r = get(json("{}"), tokens);
    REQUIRE_FALSE(r);
    REQUIRE(r.error_code == PatchErrorCode::DepthLimitExceeded);
}

TEST_CASE("get in compatibility mode", "[resolver][simplexml]") {
    auto doc = json(R"({"a": {"b": "x"}, "list": ["p", "q"], "obj": {"c": {"d": 1}}})");

    SECTION("scalar child read as a one-element array") {
        REQUIRE_FALSE(get(doc, "/a/b/0"));
        REQUIRE(get(doc, "/a/b/0", Mode::SimpleXml).get().as_string() == "x");
    }

    SECTION("object child read as a one-element array") {
        REQUIRE(get(doc, "/obj/c/0/d", Mode::SimpleXml).get().as_int() == 1);
    }

    SECTION("real arrays are not promoted") {
        REQUIRE(get(doc, "/list/0", Mode::SimpleXml).get().as_string() == "p");
        REQUIRE(get(doc, "/list/1", Mode::SimpleXml).get().as_string() == "q");
    }

    SECTION("promotion only serves index 0") {
        REQUIRE_FALSE(get(doc, "/a/b/1", Mode::SimpleXml));
    }
}
