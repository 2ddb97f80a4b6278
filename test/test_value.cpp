// test_value.cpp - Tests for Value, builders, JSON codec and checked path access

#include <catch2/catch_all.hpp>
#include <render_diff/builders.h>
#include <render_diff/lager_lens.h>
#include <render_diff/serialization.h>
#include <render_diff/value.h>

#include <string>

using namespace render_diff;

namespace {

Value create_page_value() {
    // {
    //   "identifier": {"url": "doc://kit/documentation/kit", "interfaceLanguage": "swift"},
    //   "metadata": {"title": "Kit", "required": false},
    //   "tags": ["alpha", "beta"]
    // }
    return Value::map({
        {"identifier", Value::map({
            {"url", "doc://kit/documentation/kit"},
            {"interfaceLanguage", "swift"}
        })},
        {"metadata", Value::map({{"title", "Kit"}, {"required", false}})},
        {"tags", Value::vector({"alpha", "beta"})}
    });
}

} // namespace

// ============================================================
// Value basics
// ============================================================

TEST_CASE("Value construction and accessors", "[value]") {
    SECTION("scalars") {
        REQUIRE(Value{}.is_null());
        REQUIRE(Value{42}.as_int64() == 42);
        REQUIRE(Value{2.5}.as_double() == 2.5);
        REQUIRE(Value{true}.as_bool());
        REQUIRE(Value{"text"}.as_string() == "text");
        REQUIRE(Value{"text"}.is_string());
    }

    SECTION("const char* is a string, not a bool") {
        Value v{"yes"};
        REQUIRE(v.is<std::string>());
        REQUIRE_FALSE(v.is<bool>());
    }

    SECTION("type names") {
        REQUIRE(value_type_name(Value{}) == "null");
        REQUIRE(value_type_name(Value{1}) == "integer");
        REQUIRE(value_type_name(Value::map({})) == "map");
        REQUIRE(value_type_name(Value::vector({})) == "vector");
    }
}

TEST_CASE("Value containers are persistent", "[value][container]") {
    auto page = create_page_value();

    SECTION("at and find") {
        REQUIRE(page.at("metadata").at("title").as_string() == "Kit");
        REQUIRE(page.at("tags").at(1).as_string() == "beta");
        REQUIRE(page.find("missing") == nullptr);
        REQUIRE(page.at("tags").at(5).is_null());
    }

    SECTION("set leaves the original untouched") {
        auto updated = page.set("tags", Value::vector({}));
        REQUIRE(updated.at("tags").size() == 0);
        REQUIRE(page.at("tags").size() == 2);
    }

    SECTION("insert and erase in a vector") {
        auto tags = page.at("tags");
        auto inserted = tags.insert(1, Value{"middle"});
        REQUIRE(inserted.size() == 3);
        REQUIRE(inserted.at(1).as_string() == "middle");
        REQUIRE(inserted.at(2).as_string() == "beta");

        auto appended = tags.insert(2, Value{"gamma"});
        REQUIRE(appended.at(2).as_string() == "gamma");

        auto erased = tags.erase(std::size_t{0});
        REQUIRE(erased.size() == 1);
        REQUIRE(erased.at(0).as_string() == "beta");
    }

    SECTION("insert past the end is rejected") {
        auto tags = page.at("tags");
        REQUIRE(tags.insert(3, Value{"x"}) == tags);
    }

    SECTION("structural equality") {
        REQUIRE(create_page_value() == page);
        REQUIRE_FALSE(page.set("tags", Value{}) == page);
    }
}

TEST_CASE("MapBuilder and VectorBuilder", "[value][builder]") {
    auto value = MapBuilder()
        .set("op", "add")
        .set("path", "/tags/0")
        .set("value", "beta")
        .finish();
    REQUIRE(value.size() == 3);
    REQUIRE(value.at("op").as_string() == "add");

    MapBuilder builder;
    builder.set("count", 1);
    builder.set("count", 2);
    REQUIRE(builder.finish() == Value::map({{"count", 2}}));

    auto items = VectorBuilder().push_back(1).push_back("two").finish();
    REQUIRE(items.size() == 2);
    REQUIRE(items.at(1).as_string() == "two");
}

// ============================================================
// JSON codec
// ============================================================

TEST_CASE("to_json writes sorted, deterministic output", "[value][json]") {
    auto value = Value::map({
        {"b", Value::vector({true, Value{}})},
        {"a", 1},
        {"c", 2.0},
    });

    REQUIRE(to_json(value, true) == R"({"a":1,"b":[true,null],"c":2.0})");
    REQUIRE(to_json(Value{"line\n\"quoted\""}, true) == R"("line\n\"quoted\"")");
    REQUIRE(to_json(Value::map({}), true) == "{}");
}

TEST_CASE("from_json parses documents", "[value][json]") {
    SECTION("objects, arrays and scalars") {
        std::string error;
        auto value = from_json(R"({"n": -12, "d": 0.5, "s": "a\u00e9", "list": [1, "x", null, false]})", &error);
        REQUIRE(error.empty());
        REQUIRE(value.at("n").as_int64() == -12);
        REQUIRE(value.at("d").as_double() == 0.5);
        REQUIRE(value.at("s").as_string() == "a\xc3\xa9");
        REQUIRE(value.at("list").size() == 4);
        REQUIRE(value.at("list").at(2).is_null());
    }

    SECTION("surrogate pairs") {
        auto value = from_json(R"("\ud83d\ude00")");
        REQUIRE(value.as_string() == "\xf0\x9f\x98\x80");
    }

    SECTION("a high surrogate must be followed by a low one") {
        std::string error;
        auto value = from_json(R"("\ud83d\u0041")", &error);
        REQUIRE(value.is_null());
        REQUIRE(error.find("low surrogate") != std::string::npos);
    }

    SECTION("round trip through text") {
        auto page = create_page_value();
        REQUIRE(from_json(to_json(page)) == page);
        REQUIRE(from_json(to_json(Value{3.0}, true)).is<double>());
    }

    SECTION("errors are reported") {
        std::string error;
        auto value = from_json(R"({"a": 1,})", &error);
        REQUIRE(value.is_null());
        REQUIRE_FALSE(error.empty());

        error.clear();
        (void)from_json("[1] trailing", &error);
        REQUIRE_FALSE(error.empty());
    }
}

// ============================================================
// Checked path access
// ============================================================

TEST_CASE("get_at_path_safe reports where traversal failed", "[value][path]") {
    auto page = create_page_value();

    SECTION("success") {
        auto result = get_at_path_safe(page, make_path("metadata", "title"));
        REQUIRE(result);
        REQUIRE(result.value.as_string() == "Kit");
        REQUIRE(result.resolved_path == make_path("metadata", "title"));
    }

    SECTION("empty path is the root") {
        auto result = get_at_path_safe(page, Path{});
        REQUIRE(result);
        REQUIRE(result.value == page);
    }

    SECTION("missing key") {
        auto result = get_at_path_safe(page, make_path("metadata", "role"));
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PathErrorCode::KeyNotFound);
        REQUIRE(result.failed_at_index == 1);
        REQUIRE(result.resolved_path == make_path("metadata"));
        REQUIRE(result.value.is_null());
    }

    SECTION("index out of range") {
        auto result = get_at_path_safe(page, make_path("tags", 9));
        REQUIRE(result.error_code == PathErrorCode::IndexOutOfRange);
        REQUIRE(result.error_message.find("index 9") != std::string::npos);
    }

    SECTION("descending into a scalar") {
        auto result = get_at_path_safe(page, make_path("metadata", "title", "x"));
        REQUIRE(result.error_code == PathErrorCode::TypeMismatch);
    }
}

TEST_CASE("value_path_lens reads and writes existing members", "[value][path][lens]") {
    auto page = create_page_value();

    REQUIRE(lager::view(value_path_lens(make_path("identifier", "interfaceLanguage")), page).as_string() == "swift");

    auto updated = lager::set(value_path_lens(make_path("tags", 0)), page, Value{"first"});
    REQUIRE(updated.at("tags").at(0).as_string() == "first");
    REQUIRE(page.at("tags").at(0).as_string() == "alpha");

    REQUIRE(lager::set(value_path_lens(make_path("metadata", "role")), page, Value{"symbol"}) == page);
    REQUIRE(lager::set(value_path_lens(make_path("tags", 7)), page, Value{"x"}) == page);
}
