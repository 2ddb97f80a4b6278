// test_sequence_diff.cpp - Tests for similarity-driven sequence alignment

#include <catch2/catch_all.hpp>
#include <render_diff/sequence_diff.h>

#include <string>
#include <utility>
#include <vector>

using namespace render_diff;

namespace {

using Matches = std::vector<std::pair<std::size_t, std::size_t>>;
using Indices = std::vector<std::size_t>;

EditScript align_strings(const std::vector<std::string>& previous, const std::vector<std::string>& current,
                         std::size_t max_cells = 1'000'000)
{
    return align(previous, current, [](const std::string& a, const std::string& b) { return a == b; }, max_cells);
}

} // namespace

TEST_CASE("align handles empty sequences", "[sequence]") {
    SECTION("empty to empty") {
        auto script = align_strings({}, {});
        REQUIRE(script.is_identity());
        REQUIRE(script.matches.empty());
    }

    SECTION("empty to non-empty is all insertions") {
        auto script = align_strings({}, {"a", "b"});
        REQUIRE(script.removals.empty());
        REQUIRE(script.insertions == Indices{0, 1});
    }

    SECTION("non-empty to empty is all removals") {
        auto script = align_strings({"a", "b"}, {});
        REQUIRE(script.removals == Indices{0, 1});
        REQUIRE(script.insertions.empty());
    }
}

TEST_CASE("align matches common prefix and suffix", "[sequence]") {
    SECTION("identical") {
        auto script = align_strings({"a", "b", "c"}, {"a", "b", "c"});
        REQUIRE(script.is_identity());
        REQUIRE(script.matches == Matches{{0, 0}, {1, 1}, {2, 2}});
    }

    SECTION("one appended element") {
        auto script = align_strings({"a", "b"}, {"a", "b", "c"});
        REQUIRE(script.removals.empty());
        REQUIRE(script.insertions == Indices{2});
        REQUIRE(script.matches == Matches{{0, 0}, {1, 1}});
    }

    SECTION("one element removed in the middle") {
        auto script = align_strings({"a", "b", "c"}, {"a", "c"});
        REQUIRE(script.removals == Indices{1});
        REQUIRE(script.insertions.empty());
        REQUIRE(script.matches == Matches{{0, 0}, {2, 1}});
    }
}

TEST_CASE("align finds a longest common subsequence", "[sequence]") {
    auto script = align_strings({"a", "b", "c", "d", "e"}, {"b", "x", "d", "e", "y"});

    REQUIRE(script.removals == Indices{0, 2});
    REQUIRE(script.insertions == Indices{1, 4});
    REQUIRE(script.matches == Matches{{1, 0}, {3, 2}, {4, 3}});
}

TEST_CASE("align keeps duplicates in original order", "[sequence]") {
    SECTION("duplicate appended") {
        auto script = align_strings({"a"}, {"a", "a"});
        REQUIRE(script.matches == Matches{{0, 0}});
        REQUIRE(script.insertions == Indices{1});
    }

    SECTION("duplicate removed") {
        auto script = align_strings({"a", "a", "b"}, {"a", "b"});
        REQUIRE(script.removals == Indices{1});
        REQUIRE(script.matches == Matches{{0, 0}, {2, 1}});
    }

    SECTION("earliest pairs first") {
        auto script = align_strings({"x", "a", "a"}, {"a", "y"});
        REQUIRE(script.matches == Matches{{1, 0}});
        REQUIRE(script.removals == Indices{0, 2});
        REQUIRE(script.insertions == Indices{1});
    }
}

TEST_CASE("align uses similarity, not equality", "[sequence]") {
    struct Item {
        int id;
        int version;
    };
    std::vector<Item> previous{{1, 1}, {2, 1}};
    std::vector<Item> current{{2, 2}, {1, 1}};

    auto script = align(previous, current, [](const Item& a, const Item& b) { return a.id == b.id; }, 100);

    // One element kept (and diffed in place), one moved by remove + add
    REQUIRE(script.matches.size() == 1);
    REQUIRE(script.removals.size() == 1);
    REQUIRE(script.insertions.size() == 1);
    REQUIRE(script.matches[0] == std::pair<std::size_t, std::size_t>{1, 0});
}

TEST_CASE("align gives up above the cell limit", "[sequence][limit]") {
    std::vector<std::string> previous{"p0", "p1", "p2", "p3"};
    std::vector<std::string> current{"c0", "c1", "c2", "c3"};

    REQUIRE(align_strings(previous, current, 15).exceeded_limit);
    REQUIRE_FALSE(align_strings(previous, current, 16).exceeded_limit);

    SECTION("prefix and suffix do not count against the limit") {
        auto script = align_strings({"a", "x", "z"}, {"a", "y", "z"}, 1);
        REQUIRE_FALSE(script.exceeded_limit);
        REQUIRE(script.removals == Indices{1});
        REQUIRE(script.insertions == Indices{1});
    }
}
