// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render_references.h
/// @brief Entries of a page's reference table, tagged by "type" on the wire.

#pragma once

#include <render_diff/api.h>
#include <render_diff/kind_variant.h>
#include <render_diff/render_content.h>

#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace render_diff {

struct TopicRenderReference {
    std::string identifier;
    std::string title;
    std::string url;
    std::string kind_name;            // "symbol", "article", ... ("kind" on the wire)
    std::optional<std::string> role;
    InlineContentList abstract;

    [[nodiscard]] std::string_view kind() const noexcept { return "topic"; }
    [[nodiscard]] bool is_similar(const TopicRenderReference& other) const { return identifier == other.identifier; }
    RENDER_DIFF_API void difference_from(const TopicRenderReference& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const TopicRenderReference&) const = default;
};

/// One rendition of an image (light/dark, 1x/2x)
struct ImageVariant {
    std::string url;
    immer::vector<std::string> traits;

    bool operator==(const ImageVariant&) const = default;
};

struct ImageRenderReference {
    std::string identifier;
    std::optional<std::string> alt;
    immer::vector<ImageVariant> variants;

    [[nodiscard]] std::string_view kind() const noexcept { return "image"; }
    [[nodiscard]] bool is_similar(const ImageRenderReference& other) const { return identifier == other.identifier; }
    RENDER_DIFF_API void difference_from(const ImageRenderReference& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const ImageRenderReference&) const = default;
};

struct LinkRenderReference {
    std::string identifier;
    std::string title;
    std::string url;

    [[nodiscard]] std::string_view kind() const noexcept { return "link"; }
    [[nodiscard]] bool is_similar(const LinkRenderReference& other) const { return identifier == other.identifier; }
    RENDER_DIFF_API void difference_from(const LinkRenderReference& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const LinkRenderReference&) const = default;
};

/// Reference that could not be resolved at build time
struct UnresolvedRenderReference {
    std::string identifier;
    std::string title;

    [[nodiscard]] std::string_view kind() const noexcept { return "unresolvable"; }
    [[nodiscard]] bool is_similar(const UnresolvedRenderReference& other) const { return identifier == other.identifier; }
    RENDER_DIFF_API void difference_from(const UnresolvedRenderReference& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const UnresolvedRenderReference&) const = default;
};

using AnyRenderReference = KindVariant<TopicRenderReference,
                                       ImageRenderReference,
                                       LinkRenderReference,
                                       UnresolvedRenderReference,
                                       UnrecognizedKind>;

/// Reference table keyed by identifier
using RenderReferenceMap = immer::map<std::string, AnyRenderReference>;

[[nodiscard]] RENDER_DIFF_API Value to_value(const TopicRenderReference& reference);
[[nodiscard]] RENDER_DIFF_API Value to_value(const ImageVariant& variant);
[[nodiscard]] RENDER_DIFF_API Value to_value(const ImageRenderReference& reference);
[[nodiscard]] RENDER_DIFF_API Value to_value(const LinkRenderReference& reference);
[[nodiscard]] RENDER_DIFF_API Value to_value(const UnresolvedRenderReference& reference);

} // namespace render_diff
