// test_simplexml.cpp - Tests for the XML-converter compatibility mode

#include "test_helpers.h"

#include <treepatch/equality.h>
#include <treepatch/patch.h>

using namespace treepatch;

namespace {

Value apply_xml(const char* doc, const char* ops) {
    auto result = patch(json(doc), json(ops), Mode::SimpleXml);
    INFO("doc: " << doc << " patch: " << ops << " error: " << result.error_message);
    REQUIRE(result);
    return result.value;
}

} // anonymous namespace

TEST_CASE("simplexml add promotes a lone scalar to an array", "[simplexml]") {
    auto v = apply_xml(R"({"foo":1})", R"([{"op":"add","path":"/foo/1","value":2}])");
    REQUIRE(v == json(R"({"foo":[1,2]})"));

    SECTION("same patch without compatibility mode fails") {
        auto result = patch(json(R"({"foo":1})"), json(R"([{"op":"add","path":"/foo/1","value":2}])"));
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::PathNotFound);
    }
}

TEST_CASE("simplexml add promotes a lone element", "[simplexml]") {
    SECTION("append position") {
        auto v = apply_xml(R"({"item":{"id":1}})", R"([{"op":"add","path":"/item/-","value":{"id":2}}])");
        REQUIRE(v == json(R"({"item":[{"id":1},{"id":2}]})"));
    }

    SECTION("front position") {
        auto v = apply_xml(R"({"item":"b"})", R"([{"op":"add","path":"/item/0","value":"a"}])");
        REQUIRE(v == json(R"({"item":["a","b"]})"));
    }

    SECTION("nested under another element") {
        auto v = apply_xml(R"({"root":{"row":{"cell":"x"}}})",
                           R"([{"op":"add","path":"/root/row/cell/1","value":"y"}])");
        REQUIRE(v == json(R"({"root":{"row":{"cell":["x","y"]}}})"));
    }
}

TEST_CASE("simplexml writes through a promoted element", "[simplexml]") {
    auto v = apply_xml(R"({"row":{"a":1}})", R"([{"op":"replace","path":"/row/0/a","value":2}])");
    REQUIRE(v == json(R"({"row":{"a":2}})"));
}

TEST_CASE("simplexml arrays of one collapse after the patch", "[simplexml]") {
    SECTION("replace inside a promoted scalar") {
        auto v = apply_xml(R"({"foo":1})", R"([{"op":"replace","path":"/foo/0","value":5}])");
        REQUIRE(v == json(R"({"foo":5})"));
    }

    SECTION("remove leaves one element") {
        auto v = apply_xml(R"({"foo":[1,2]})", R"([{"op":"remove","path":"/foo/0"}])");
        REQUIRE(v == json(R"({"foo":2})"));
    }

    SECTION("arrays of one already in the document") {
        auto v = apply_xml(R"({"a":["x"],"b":[1,2]})", R"([{"op":"add","path":"/c","value":[[3]]}])");
        REQUIRE(v == json(R"({"a":"x","b":[1,2],"c":3})"));
    }

    SECTION("collapse runs after the whole list") {
        // foo is still an array of one when the test runs
        auto v = apply_xml(R"({"foo":[1,2,3]})", R"([
            {"op":"remove","path":"/foo/0"},
            {"op":"remove","path":"/foo/0"},
            {"op":"test","path":"/foo","value":[3]}
        ])");
        REQUIRE(v == json(R"({"foo":3})"));
    }
}

TEST_CASE("simplexml test reads a lone element by index", "[simplexml]") {
    apply_xml(R"({"a":{"b":"x"}})", R"([{"op":"test","path":"/a/b/0","value":"x"}])");

    auto result = patch(json(R"({"a":{"b":"x"}})"), json(R"([{"op":"test","path":"/a/b/1","value":"x"}])"),
                        Mode::SimpleXml);
    REQUIRE_FALSE(result);
    REQUIRE(result.error_code == PatchErrorCode::PathNotFound);
}

TEST_CASE("simplexml copy from a lone element", "[simplexml]") {
    auto v = apply_xml(R"({"a":"x","b":["y","z"]})", R"([{"op":"copy","from":"/a/0","path":"/b/-"}])");
    REQUIRE(v == json(R"({"a":"x","b":["y","z","x"]})"));
}

TEST_CASE("collapse_singletons", "[simplexml]") {
    SECTION("nested arrays of one collapse all the way") {
        auto r = collapse_singletons(json(R"({"a":[[[1]]],"b":[{"c":["d"]}]})"));
        REQUIRE(r);
        REQUIRE(r.value == json(R"({"a":1,"b":{"c":"d"}})"));
    }

    SECTION("array-like maps of one collapse too") {
        auto r = collapse_singletons(json(R"({"a":{"0":"x"}})"));
        REQUIRE(r.value == json(R"({"a":"x"})"));
    }

    SECTION("the document itself") {
        REQUIRE(collapse_singletons(json("[7]")).value == Value{7});
    }

    SECTION("empty and longer containers stay") {
        auto doc = json(R"({"e":[],"o":{},"l":[1,[2]],"k":{"x":1}})");
        auto r = collapse_singletons(doc);
        REQUIRE(r.value == json(R"({"e":[],"o":{},"l":[1,2],"k":{"x":1}})"));
    }

    SECTION("unchanged input") {
        auto doc = json(R"({"a":[1,2],"b":"c"})");
        REQUIRE(collapse_singletons(doc).value == doc);
    }
}
