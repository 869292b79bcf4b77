// test_json_pointer.cpp - Tests for the JSON Pointer codec

#include "test_helpers.h"

#include <treepatch/json_pointer.h>

using namespace treepatch;

TEST_CASE("decompose_pointer", "[pointer]") {
    SECTION("empty pointer is the root") {
        auto r = decompose_pointer("");
        REQUIRE(r);
        REQUIRE(r.tokens.empty());
    }

    SECTION("plain tokens") {
        auto r = decompose_pointer("/users/0/name");
        REQUIRE(r);
        REQUIRE(r.tokens == Tokens{"users", "0", "name"});
    }

    SECTION("empty tokens are kept") {
        REQUIRE(decompose_pointer("/").tokens == Tokens{""});
        REQUIRE(decompose_pointer("//").tokens == Tokens{"", ""});
        REQUIRE(decompose_pointer("/a/").tokens == Tokens{"a", ""});
    }

    SECTION("escapes") {
        REQUIRE(decompose_pointer("/a~1b").tokens == Tokens{"a/b"});
        REQUIRE(decompose_pointer("/m~0n").tokens == Tokens{"m~n"});
        // ~1 is decoded before ~0
        REQUIRE(decompose_pointer("/~01").tokens == Tokens{"~1"});
        REQUIRE(decompose_pointer("/~10").tokens == Tokens{"/0"});
    }

    SECTION("missing leading slash") {
        auto r = decompose_pointer("a/b");
        REQUIRE_FALSE(r);
        REQUIRE(r.error_code == PatchErrorCode::MalformedPointer);
        REQUIRE_FALSE(r.error_message.empty());
    }
}

TEST_CASE("escape and unescape", "[pointer]") {
    REQUIRE(escape_pointer_part("a/b") == "a~1b");
    REQUIRE(escape_pointer_part("m~n") == "m~0n");
    REQUIRE(escape_pointer_part("~/") == "~0~1");
    REQUIRE(escape_pointer_part("plain") == "plain");

    for (const std::string token : {"", "a/b", "~", "~1", "~0", "/~", "~~//", "x~1y/z"}) {
        INFO(token);
        REQUIRE(unescape_pointer_part(escape_pointer_part(token)) == token);
    }
}

TEST_CASE("compose_pointer", "[pointer]") {
    REQUIRE(compose_pointer({}) == "");
    REQUIRE(compose_pointer({""}) == "/");
    REQUIRE(compose_pointer({"a/b", "c~d", "0"}) == "/a~1b/c~0d/0");

    SECTION("compose inverts decompose") {
        for (const char* p : {"", "/", "//", "/a", "/a/b/0", "/a~1b/~0/", "/~01/~10", "/-"}) {
            INFO(p);
            auto r = decompose_pointer(p);
            REQUIRE(r);
            REQUIRE(compose_pointer(r.tokens) == p);
        }
    }
}
