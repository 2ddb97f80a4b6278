// test_json_pointer.cpp - Tests for JSON Pointer rendering and parsing
// RFC 6901 escaping, index tokens, pointer-addressed access

#include <catch2/catch_all.hpp>
#include <render_diff/json_pointer.h>
#include <render_diff/value.h>

#include <string>

using namespace render_diff;

// ============================================================
// Rendering
// ============================================================

TEST_CASE("path_to_json_pointer renders names and indices", "[pointer][render]") {
    SECTION("root is the empty string") {
        REQUIRE(path_to_json_pointer(Path{}).empty());
    }

    SECTION("names and indices") {
        REQUIRE(path_to_json_pointer(make_path("tags", 0)) == "/tags/0");
        REQUIRE(path_to_json_pointer(make_path("references", "doc://kit/widget", "title"))
                == "/references/doc:~1~1kit~1widget/title");
    }

    SECTION("escaping of slash and tilde") {
        REQUIRE(path_to_json_pointer(make_path("a/b~c")) == "/a~1b~0c");
        REQUIRE(escape_pointer_token("~1") == "~01");
    }

    SECTION("empty name is a segment of its own") {
        REQUIRE(path_to_json_pointer(make_path("")) == "/");
        REQUIRE(path_to_json_pointer(make_path("a", "")) == "/a/");
    }
}

// ============================================================
// Parsing
// ============================================================

TEST_CASE("split_json_pointer unescapes tokens", "[pointer][parse]") {
    SECTION("valid pointer") {
        auto result = split_json_pointer("/a~1b~0c/0");
        REQUIRE(result);
        REQUIRE(result.tokens.size() == 2);
        REQUIRE(result.tokens[0] == "a/b~c");
        REQUIRE(result.tokens[1] == "0");
    }

    SECTION("~01 decodes to ~1, not to a slash") {
        auto result = split_json_pointer("/~01");
        REQUIRE(result);
        REQUIRE(result.tokens[0] == "~1");
    }

    SECTION("missing leading slash") {
        auto result = split_json_pointer("tags/0");
        REQUIRE_FALSE(result);
        REQUIRE_FALSE(result.error_message.empty());
    }

    SECTION("dangling tilde") {
        REQUIRE_FALSE(split_json_pointer("/a~"));
        REQUIRE_FALSE(split_json_pointer("/a~2"));
    }
}

TEST_CASE("is_array_index_token accepts canonical decimals only", "[pointer][parse]") {
    REQUIRE(is_array_index_token("0"));
    REQUIRE(is_array_index_token("42"));
    REQUIRE_FALSE(is_array_index_token(""));
    REQUIRE_FALSE(is_array_index_token("01"));
    REQUIRE_FALSE(is_array_index_token("-"));
    REQUIRE_FALSE(is_array_index_token("1a"));
}

TEST_CASE("try_parse_json_pointer builds a Path", "[pointer][parse]") {
    SECTION("numeric tokens become indices") {
        auto path = try_parse_json_pointer("/tags/3");
        REQUIRE(path);
        REQUIRE(*path == make_path("tags", 3));
    }

    SECTION("escaped name round trips") {
        auto original = make_path("a/b~c", 1, "x");
        auto path = try_parse_json_pointer(path_to_json_pointer(original));
        REQUIRE(path);
        REQUIRE(*path == original);
    }

    SECTION("error is reported") {
        std::string error;
        REQUIRE_FALSE(try_parse_json_pointer("no-slash", &error));
        REQUIRE(error.find("must start with '/'") != std::string::npos);
    }
}

// ============================================================
// Pointer-addressed access
// ============================================================

TEST_CASE("get_by_pointer and set_by_pointer", "[pointer][lens]") {
    auto doc = Value::map({
        {"metadata", Value::map({{"title", "Intro"}})},
        {"tags", Value::vector({"alpha", "beta"})},
    });

    SECTION("get") {
        REQUIRE(get_by_pointer(doc, "/metadata/title").as_string() == "Intro");
        REQUIRE(get_by_pointer(doc, "/tags/1").as_string() == "beta");
        REQUIRE(get_by_pointer(doc, "") == doc);
        REQUIRE(get_by_pointer(doc, "/missing").is_null());
    }

    SECTION("set") {
        auto updated = set_by_pointer(doc, "/metadata/title", Value{"Overview"});
        REQUIRE(get_by_pointer(updated, "/metadata/title").as_string() == "Overview");
        REQUIRE(get_by_pointer(doc, "/metadata/title").as_string() == "Intro");
    }

    SECTION("over") {
        auto updated = over_by_pointer(doc, "/metadata/title", [](const Value& v) {
            return Value{v.as_string() + "!"};
        });
        REQUIRE(get_by_pointer(updated, "/metadata/title").as_string() == "Intro!");
    }

    SECTION("malformed pointers leave the document unchanged") {
        auto pointer = GENERATE(as<std::string>{}, "a/b", "/~2", "/metadata/bad~");
        INFO("pointer " << pointer);

        REQUIRE(get_by_pointer(doc, pointer).is_null());
        REQUIRE(set_by_pointer(doc, pointer, Value{int64_t{1}}) == doc);
        REQUIRE(over_by_pointer(doc, pointer, [](const Value&) { return Value{int64_t{1}}; }) == doc);
    }
}
