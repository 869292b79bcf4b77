// test_pointer_lens.cpp - Tests for pointer_lens

#include "test_helpers.h"

#include <treepatch/pointer_lens.h>

#include <lager/lenses.hpp>

using namespace treepatch;

TEST_CASE("pointer_lens view", "[lens]") {
    auto doc = json(R"({"users":[{"name":"Alice"},{"name":"Bob"}],"a/b":1})");

    REQUIRE(lager::view(pointer_lens("/users/1/name"), doc) == Value{"Bob"});
    REQUIRE(lager::view(pointer_lens("/a~1b"), doc) == Value{1});
    REQUIRE(lager::view(pointer_lens(Tokens{"users", "0"}), doc) == json(R"({"name":"Alice"})"));

    SECTION("missing target views null") {
        REQUIRE(lager::view(pointer_lens("/users/5"), doc).is_null());
        REQUIRE(lager::view(pointer_lens("/nope/x"), doc).is_null());
    }

    SECTION("empty pointer is the whole document") {
        REQUIRE(lager::view(pointer_lens(""), doc) == doc);
    }
}

TEST_CASE("pointer_lens set", "[lens]") {
    auto doc = json(R"({"users":[{"name":"Alice"}],"count":1})");
    const auto before = doc;

    SECTION("existing member is replaced") {
        auto v = lager::set(pointer_lens("/count"), doc, Value{2});
        REQUIRE(v == json(R"({"users":[{"name":"Alice"}],"count":2})"));
        REQUIRE(doc == before);
    }

    SECTION("existing element is replaced, not shifted") {
        auto v = lager::set(pointer_lens("/users/0"), doc, json(R"({"name":"Zed"})"));
        REQUIRE(v == json(R"({"users":[{"name":"Zed"}],"count":1})"));
    }

    SECTION("missing member is added") {
        auto v = lager::set(pointer_lens("/users/0/age"), doc, Value{30});
        REQUIRE(v == json(R"({"users":[{"name":"Alice","age":30}],"count":1})"));
    }

    SECTION("array end is appended") {
        auto v = lager::set(pointer_lens("/users/-"), doc, json(R"({"name":"Bob"})"));
        REQUIRE(v == json(R"({"users":[{"name":"Alice"},{"name":"Bob"}],"count":1})"));
    }

    SECTION("unreachable target leaves the document alone") {
        REQUIRE(lager::set(pointer_lens("/missing/deep"), doc, Value{1}) == doc);
        REQUIRE(lager::set(pointer_lens("/users/7"), doc, Value{1}) == doc);
    }

    SECTION("empty pointer replaces the document") {
        REQUIRE(lager::set(pointer_lens(""), doc, Value{"x"}) == Value{"x"});
    }
}

TEST_CASE("pointer_lens over", "[lens]") {
    auto doc = json(R"({"n":1})");
    auto v = lager::over(pointer_lens("/n"), doc, [](Value n) { return Value{n.as_int() + 1}; });
    REQUIRE(v == json(R"({"n":2})"));
}

TEST_CASE("pointer_lens with a malformed pointer", "[lens]") {
    auto doc = json(R"({"a":1})");
    auto lens = pointer_lens("a");
    REQUIRE(lager::view(lens, doc).is_null());
    REQUIRE(lager::set(lens, doc, Value{2}) == doc);
}

TEST_CASE("pointer_lens in compatibility mode", "[lens][simplexml]") {
    auto doc = json(R"({"row":{"cell":"x"}})");

    REQUIRE(lager::view(pointer_lens("/row/cell/0", Mode::SimpleXml), doc) == Value{"x"});

    auto v = lager::set(pointer_lens("/row/cell/1", Mode::SimpleXml), doc, Value{"y"});
    REQUIRE(v == json(R"({"row":{"cell":["x","y"]}})"));

    auto same = lager::set(pointer_lens("/row/cell/0", Mode::SimpleXml), doc, Value{"z"});
    REQUIRE(same == json(R"({"row":{"cell":"z"}})"));
}
