// test_archive_diff.cpp - Tests for change classification and whole-archive diffing

#include <catch2/catch_all.hpp>
#include <render_diff/archive_diff.h>
#include <render_diff/serialization.h>

#include <string>
#include <thread>
#include <vector>

using namespace render_diff;

namespace {

RenderNode create_page(const std::string& name) {
    RenderNode page;
    page.identifier = TopicIdentifier{"kit", "/documentation/kit/" + name, "swift"};
    page.kind = RenderNodeKind::Symbol;
    page.metadata.title = name;
    page.metadata.platforms = immer::vector<PlatformAvailability>{
        PlatformAvailability{"macOS", "12.0", false, false},
        PlatformAvailability{"iOS", "15.0", false, false},
    };
    page.primary_content_sections = RenderSectionList{
        ContentRenderSection{"Overview", InlineContentList{TextInline{"About " + name + "."}}},
    };
    return page;
}

RenderNode with_overview(RenderNode page, const std::string& text) {
    page.primary_content_sections = RenderSectionList{
        ContentRenderSection{"Overview", InlineContentList{TextInline{text}}},
    };
    return page;
}

RenderNode deprecated_on_ios(RenderNode page) {
    page.metadata.platforms = page.metadata.platforms->set(1, PlatformAvailability{"iOS", "15.0", true, false});
    return page;
}

const ArchiveVersion version_one{"1.0", "Kit 1.0"};

} // namespace

TEST_CASE("classify_change", "[archive][classify]") {
    auto previous = create_page("widget");

    SECTION("new page") {
        auto current = create_page("widget");
        REQUIRE(classify_change(nullptr, current, DiffResult{}) == RenderIndexChange::Added);
    }

    SECTION("unchanged page") {
        auto result = diff_render_nodes(previous, previous);
        REQUIRE_FALSE(classify_change(&previous, previous, result));
    }

    SECTION("edited page") {
        auto current = with_overview(previous, "Widgets are great.");
        REQUIRE(classify_change(&previous, current, diff_render_nodes(previous, current)) == RenderIndexChange::Modified);
    }

    SECTION("newly deprecated platform") {
        auto current = deprecated_on_ios(previous);
        REQUIRE(classify_change(&previous, current, diff_render_nodes(previous, current)) == RenderIndexChange::Deprecated);
    }

    SECTION("already deprecated platform is a modification") {
        auto deprecated = deprecated_on_ios(previous);
        auto current = with_overview(deprecated, "Use Gadget instead.");
        REQUIRE(classify_change(&deprecated, current, diff_render_nodes(deprecated, current)) == RenderIndexChange::Modified);
    }

    REQUIRE(render_index_change_name(RenderIndexChange::Deprecated) == "deprecated");
}

TEST_CASE("DifferencesCache records changes per page and version", "[archive][cache]") {
    DifferencesCache cache;
    REQUIRE(cache.size() == 0);

    cache.record("/documentation/kit/widget", "1.0", RenderIndexChange::Modified);
    cache.record("/documentation/kit/widget", "0.9", RenderIndexChange::Added);
    cache.record("/documentation/kit/gadget", "1.0", RenderIndexChange::Deprecated);
    cache.record("/documentation/kit/widget", "1.0", RenderIndexChange::Deprecated);

    REQUIRE(cache.size() == 2);
    REQUIRE(cache.lookup("/documentation/kit/widget", "1.0") == RenderIndexChange::Deprecated);
    REQUIRE(cache.lookup("/documentation/kit/widget", "0.9") == RenderIndexChange::Added);
    REQUIRE_FALSE(cache.lookup("/documentation/kit/widget", "2.0"));
    REQUIRE_FALSE(cache.lookup("/documentation/kit/other", "1.0"));

    REQUIRE(to_json(cache.to_value(), true) ==
            R"({"/documentation/kit/gadget":{"1.0":"deprecated"},)"
            R"("/documentation/kit/widget":{"0.9":"added","1.0":"deprecated"}})");
}

TEST_CASE("DifferencesCache accepts concurrent writers", "[archive][cache][thread]") {
    DifferencesCache cache;
    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&cache, w]() {
            for (int i = 0; i < 100; ++i) {
                cache.record("/page/" + std::to_string(i), "v" + std::to_string(w), RenderIndexChange::Modified);
                (void)cache.lookup("/page/" + std::to_string(i), "v0");
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    REQUIRE(cache.size() == 100);
    REQUIRE(cache.snapshot().at("/page/42").size() == 4);
}

TEST_CASE("ArchiveDiffer diffs single pages", "[archive][differ]") {
    ArchiveDiffer differ{version_one};

    SECTION("new page is added whole") {
        auto current = create_page("widget");
        auto page = differ.diff_page(std::nullopt, current);

        REQUIRE(page.page == "/documentation/kit/widget");
        REQUIRE(page.change == RenderIndexChange::Added);
        REQUIRE(page.result.patch == Patch{PatchOperation::add(Path{}, to_value(current))});
        REQUIRE(differ.cache().lookup(page.page, "1.0") == RenderIndexChange::Added);
    }

    SECTION("unchanged page is not recorded") {
        auto current = create_page("widget");
        auto page = differ.diff_page(current, current);
        REQUIRE_FALSE(page.change);
        REQUIRE(page.result.patch.empty());
        REQUIRE(differ.cache().size() == 0);
    }

    SECTION("version patch carries the previous version") {
        auto previous = create_page("widget");
        auto current = with_overview(previous, "Updated.");
        auto page = differ.diff_page(previous, current);
        auto version_patch = differ.version_patch(page);

        REQUIRE(version_patch.version == version_one);
        REQUIRE(version_patch.patch == page.result.patch);

        auto encoded = to_value(version_patch);
        REQUIRE(encoded.at("version").at("displayName").as_string() == "Kit 1.0");
        REQUIRE(encoded.at("patch").at(0).at("path").as_string() ==
                "/primaryContentSections/0/content/0");
    }
}

TEST_CASE("ArchiveDiffer diffs many pages in input order", "[archive][differ][thread]") {
    std::vector<PageVersions> pages;
    for (int i = 0; i < 40; ++i) {
        auto name = "page" + std::to_string(i);
        auto previous = create_page(name);
        switch (i % 4) {
            case 0: pages.push_back({previous, previous}); break;
            case 1: pages.push_back({previous, with_overview(previous, "Rewritten.")}); break;
            case 2: pages.push_back({previous, deprecated_on_ios(previous)}); break;
            default: pages.push_back({std::nullopt, previous}); break;
        }
    }

    auto expected_change = [](int i) -> std::optional<RenderIndexChange> {
        switch (i % 4) {
            case 0: return std::nullopt;
            case 1: return RenderIndexChange::Modified;
            case 2: return RenderIndexChange::Deprecated;
            default: return RenderIndexChange::Added;
        }
    };

    auto workers = GENERATE(std::size_t{1}, std::size_t{4}, std::size_t{64});
    ArchiveDiffer differ{version_one};
    auto results = differ.diff_pages(pages, workers);

    REQUIRE(results.size() == pages.size());
    for (int i = 0; i < 40; ++i) {
        INFO("page " << i << " with " << workers << " workers");
        REQUIRE(results[i].page == "/documentation/kit/page" + std::to_string(i));
        REQUIRE(results[i].change == expected_change(i));
        REQUIRE(differ.cache().lookup(results[i].page, "1.0") == expected_change(i));
    }
    REQUIRE(differ.cache().size() == 30);

    SECTION("patches apply to the previous versions") {
        for (std::size_t i = 0; i < pages.size(); ++i) {
            const auto& versions = pages[i];
            Value document = versions.previous ? to_value(*versions.previous) : Value{};
            auto applied = apply_patch(document, results[i].result.patch);
            REQUIRE(applied.ok());
            REQUIRE(applied.value == to_value(versions.current));
        }
    }
}

TEST_CASE("ArchiveDiffer handles an empty archive", "[archive][differ]") {
    ArchiveDiffer differ{version_one};
    REQUIRE(differ.diff_pages({}, 8).empty());
    REQUIRE(differ.cache().size() == 0);
}

TEST_CASE("ArchiveDiffer joins its workers between passes", "[archive][differ][thread]") {
    std::vector<PageVersions> pages;
    for (int i = 0; i < 3; ++i) {
        auto previous = create_page("page" + std::to_string(i));
        pages.push_back({previous, with_overview(previous, "Pass.")});
    }

    ArchiveDiffer differ{version_one};
    for (int pass = 0; pass < 3; ++pass) {
        INFO("pass " << pass);
        auto results = differ.diff_pages(pages, 16);
        REQUIRE(results.size() == 3);
        for (const auto& page : results) {
            REQUIRE(page.change == RenderIndexChange::Modified);
        }
    }
    REQUIRE(differ.cache().size() == 3);
}
