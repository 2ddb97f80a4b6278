// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render_node.h
/// @brief A rendered documentation page and the page-level diff entry point.
///
/// Usage:
/// @code
///   #include <render_diff/render_node.h>
///
///   DiffResult result = diff_render_nodes(previous_page, current_page);
///   if (result.has_changes()) {
///       std::cout << patch_to_json(result.patch) << "\n";
///   }
/// @endcode

#pragma once

#include <render_diff/api.h>
#include <render_diff/diff_collector.h>
#include <render_diff/render_content.h>
#include <render_diff/render_metadata.h>
#include <render_diff/render_references.h>
#include <render_diff/render_sections.h>
#include <render_diff/value_diff.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace render_diff {

struct SemanticVersion {
    int64_t major = 0;
    int64_t minor = 0;
    int64_t patch = 0;
    std::optional<std::string> prerelease;
    std::optional<std::string> build_metadata;

    [[nodiscard]] bool is_similar(const SemanticVersion&) const { return true; }
    RENDER_DIFF_API void difference_from(const SemanticVersion& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const SemanticVersion&) const = default;
};

/// Stable identity of a page: "doc://<bundle><path>" in a source language
struct TopicIdentifier {
    std::string bundle_identifier;
    std::string path;
    std::string source_language;

    [[nodiscard]] RENDER_DIFF_API std::string url() const;
    bool operator==(const TopicIdentifier&) const = default;
};

enum class RenderNodeKind {
    Article,
    Symbol,
    Tutorial,
    Section,
    Overview,
};

[[nodiscard]] RENDER_DIFF_API std::string_view render_node_kind_name(RenderNodeKind kind);
[[nodiscard]] RENDER_DIFF_API std::optional<RenderNodeKind> render_node_kind_from_name(std::string_view name);

/// One rendered page. Two versions of a page are similar when they share
/// the identifier and the kind; otherwise a diff replaces the page whole.
struct RenderNode {
    SemanticVersion schema_version{0, 3, 0, std::nullopt, std::nullopt};
    TopicIdentifier identifier;
    RenderNodeKind kind = RenderNodeKind::Article;
    std::optional<InlineContentList> abstract;
    RenderMetadata metadata;
    RenderSectionList primary_content_sections;
    RenderSectionList topic_sections;
    RenderSectionList see_also_sections;
    RenderReferenceMap references;

    [[nodiscard]] bool is_similar(const RenderNode& other) const {
        return identifier == other.identifier && kind == other.kind;
    }
    RENDER_DIFF_API void difference_from(const RenderNode& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const RenderNode&) const = default;
};

[[nodiscard]] RENDER_DIFF_API Value to_value(const SemanticVersion& version);
[[nodiscard]] RENDER_DIFF_API Value to_value(const TopicIdentifier& identifier);
[[nodiscard]] RENDER_DIFF_API Value to_value(RenderNodeKind kind);
[[nodiscard]] RENDER_DIFF_API Value to_value(const RenderNode& node);

/// Diff two versions of a page into a patch that turns the encoding of
/// @p previous into the encoding of @p current
[[nodiscard]] RENDER_DIFF_API DiffResult diff_render_nodes(const RenderNode& previous,
                                                           const RenderNode& current,
                                                           const DiffOptions& options = {});

} // namespace render_diff
