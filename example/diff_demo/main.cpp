// main.cpp
// Render Diff Example - Diffing two versions of rendered documentation pages
//
// Usage:
//   render_diff_demo                         Run the built-in walkthrough
//   render_diff_demo <previous> <current>    Diff two render node JSON files
//                                            and print the JSON Patch
//
// The walkthrough shows:
//   Part 1: Diffing one page and applying the patch
//   Part 2: Pages whose sections carry an unknown kind
//   Part 3: Diffing an archive of pages on several threads
//   Part 4: Diffing the navigation index

#include <render_diff/archive_diff.h>
#include <render_diff/patch.h>
#include <render_diff/render_codec.h>
#include <render_diff/render_index.h>
#include <render_diff/render_node.h>
#include <render_diff/serialization.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace render_diff;

// ============================================================
// Sample pages
// ============================================================

RenderNode create_widget_page()
{
    RenderNode page;
    page.identifier = TopicIdentifier{"kit", "/documentation/kit/widget", "swift"};
    page.kind = RenderNodeKind::Symbol;
    page.abstract = InlineContentList{TextInline{"A reusable "}, CodeVoiceInline{"View"}, TextInline{"."}};
    page.metadata.title = "Widget";
    page.metadata.role_heading = "Structure";
    page.metadata.platforms = immer::vector<PlatformAvailability>{
        PlatformAvailability{"macOS", "12.0", false, false},
        PlatformAvailability{"iOS", "15.0", false, false},
    };
    page.primary_content_sections = RenderSectionList{
        ContentRenderSection{"Overview", InlineContentList{TextInline{"Widgets draw themselves."}}},
    };
    page.topic_sections = RenderSectionList{
        TaskGroupRenderSection{"Drawing", std::nullopt,
                               immer::vector<std::string>{"doc://kit/documentation/kit/widget/draw"}, false},
    };
    page.references = RenderReferenceMap{}.set(
        "doc://kit/documentation/kit/widget/draw",
        AnyRenderReference{TopicRenderReference{"doc://kit/documentation/kit/widget/draw", "draw()",
                                                "/documentation/kit/widget/draw", "symbol", "symbol",
                                                InlineContentList{}}});
    return page;
}

RenderNode create_widget_page_v2()
{
    auto page = create_widget_page();
    page.abstract = InlineContentList{TextInline{"A reusable, animatable "}, CodeVoiceInline{"View"}, TextInline{"."}};
    page.metadata.platforms = page.metadata.platforms->set(1, PlatformAvailability{"iOS", "15.0", true, false});
    page.topic_sections = RenderSectionList{
        TaskGroupRenderSection{"Drawing", std::nullopt,
                               immer::vector<std::string>{"doc://kit/documentation/kit/widget/draw",
                                                          "doc://kit/documentation/kit/widget/animate"},
                               false},
    };
    page.references = page.references.set(
        "doc://kit/documentation/kit/widget/animate",
        AnyRenderReference{TopicRenderReference{"doc://kit/documentation/kit/widget/animate", "animate()",
                                                "/documentation/kit/widget/animate", "symbol", "symbol",
                                                InlineContentList{}}});
    return page;
}

// ============================================================
// Walkthrough
// ============================================================

void demo_single_page()
{
    std::cout << "\n=== Part 1: Diffing one page ===\n\n";

    auto previous = create_widget_page();
    auto current = create_widget_page_v2();

    auto result = diff_render_nodes(previous, current);
    std::cout << "Patch (" << result.patch.size() << " operations):\n";
    print_patch(result.patch);

    auto applied = apply_patch(to_value(previous), result.patch);
    std::cout << "\nApplied cleanly: " << (applied.ok() ? "yes" : "no") << "\n";
    std::cout << "Matches new version: " << (applied.value == to_value(current) ? "yes" : "no") << "\n";
}

void demo_unrecognized_kind()
{
    std::cout << "\n=== Part 2: Unknown section kinds ===\n\n";

    auto previous = create_widget_page();
    previous.primary_content_sections = previous.primary_content_sections.push_back(
        UnrecognizedKind{"video", Value::map({{"kind", "video"}, {"src", "intro.mov"}})});
    auto current = previous;
    current.primary_content_sections = current.primary_content_sections.set(
        1, UnrecognizedKind{"video", Value::map({{"kind", "video"}, {"src", "intro-v2.mov"}})});

    for (auto policy : {UnhandledKindPolicy::ReplaceSubtree, UnhandledKindPolicy::ReplaceRoot}) {
        DiffOptions options;
        options.unhandled_kind_policy = policy;
        auto result = diff_render_nodes(previous, current, options);

        std::cout << (policy == UnhandledKindPolicy::ReplaceSubtree ? "Replace subtree" : "Replace root") << ":\n";
        for (const auto& diagnostic : result.diagnostics) {
            std::cout << "  [" << diff_error_code_name(diagnostic.code) << "] " << diagnostic.message << "\n";
        }
        std::cout << "  " << result.patch.size() << " operation(s), first at \""
                  << (result.patch.empty() ? std::string{} : result.patch.front().pointer()) << "\"\n";
    }
}

void demo_archive()
{
    std::cout << "\n=== Part 3: Diffing an archive ===\n\n";

    std::vector<PageVersions> pages;
    pages.push_back({create_widget_page(), create_widget_page_v2()});

    auto gadget = create_widget_page();
    gadget.identifier.path = "/documentation/kit/gadget";
    gadget.metadata.title = "Gadget";
    pages.push_back({std::nullopt, gadget});

    auto sprocket = create_widget_page();
    sprocket.identifier.path = "/documentation/kit/sprocket";
    sprocket.metadata.title = "Sprocket";
    auto sprocket_v2 = sprocket;
    sprocket_v2.metadata.role_heading = "Class";
    pages.push_back({sprocket, sprocket_v2});
    pages.push_back({sprocket_v2, sprocket_v2});

    ArchiveDiffer differ{ArchiveVersion{"1.0", "Kit 1.0"}};
    auto results = differ.diff_pages(pages, 2);

    for (const auto& page : results) {
        std::cout << "  " << page.page << ": "
                  << (page.change ? render_index_change_name(*page.change) : "unchanged") << "\n";
    }

    std::cout << "\nDifferences cache:\n" << to_json(differ.cache().to_value()) << "\n";
    std::cout << "\nVersion patch for " << results[2].page << ":\n"
              << to_json(to_value(differ.version_patch(results[2]))) << "\n";
}

void demo_index()
{
    std::cout << "\n=== Part 4: Diffing the navigation index ===\n\n";

    RenderIndexNode kit{"Kit", "/documentation/kit", "module", std::nullopt, false, false, false};
    kit.children = make_index_nodes({
        RenderIndexNode{"Widget", "/documentation/kit/widget", "struct", std::nullopt, false, false, false},
    });

    RenderIndex previous;
    previous.interface_languages = previous.interface_languages.set("swift", make_index_nodes({kit}));
    previous.metadata = RenderIndexMetadata{ArchiveVersion{"1.0", "Kit 1.0"}};

    auto widget = (*kit.children)[0].get();
    widget.deprecated = true;
    kit.children = make_index_nodes({
        widget,
        RenderIndexNode{"Gadget", "/documentation/kit/gadget", "class", std::nullopt, false, false, true},
    });
    RenderIndex current = previous;
    current.interface_languages = current.interface_languages.set("swift", make_index_nodes({kit}));

    std::cout << to_json(to_value(index_version_patch(previous, current))) << "\n";
}

// ============================================================
// File mode
// ============================================================

bool read_file(const std::string& path, std::string& out)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "cannot open " << path << "\n";
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

int diff_files(const std::string& previous_path, const std::string& current_path)
{
    std::string previous_json;
    std::string current_json;
    if (!read_file(previous_path, previous_json) || !read_file(current_path, current_json)) {
        return 1;
    }

    std::string error;
    auto previous = render_node_from_json(previous_json, &error);
    if (!previous) {
        std::cerr << previous_path << ": " << error << "\n";
        return 1;
    }
    auto current = render_node_from_json(current_json, &error);
    if (!current) {
        std::cerr << current_path << ": " << error << "\n";
        return 1;
    }

    auto result = diff_render_nodes(*previous, *current);
    for (const auto& diagnostic : result.diagnostics) {
        std::cerr << "warning: " << diagnostic.message << " at \"" << diagnostic.pointer << "\"\n";
    }
    std::cout << patch_to_json(result.patch, false) << "\n";
    return 0;
}

int main(int argc, char* argv[])
{
    if (argc == 3) {
        return diff_files(argv[1], argv[2]);
    }
    if (argc != 1) {
        std::cerr << "usage: " << argv[0] << " [<previous.json> <current.json>]\n";
        return 2;
    }

    std::cout << "Render Diff Demo\n";
    demo_single_page();
    demo_unrecognized_kind();
    demo_archive();
    demo_index();
    return 0;
}
