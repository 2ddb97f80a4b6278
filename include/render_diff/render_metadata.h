// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render_metadata.h
/// @brief Page metadata: title, role, modules, platforms, tags and archive version.

#pragma once

#include <render_diff/api.h>
#include <render_diff/render_sections.h>
#include <render_diff/value_diff.h>

#include <immer/vector.hpp>

#include <optional>
#include <string>

namespace render_diff {

struct Module {
    std::string name;
    std::optional<immer::vector<std::string>> related_modules;

    [[nodiscard]] bool is_similar(const Module& other) const { return name == other.name; }
    RENDER_DIFF_API void difference_from(const Module& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const Module&) const = default;
};

struct PlatformAvailability {
    std::string name;
    std::optional<std::string> introduced_at;
    bool deprecated = false;
    bool beta = false;

    [[nodiscard]] bool is_similar(const PlatformAvailability& other) const { return name == other.name; }
    RENDER_DIFF_API void difference_from(const PlatformAvailability& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const PlatformAvailability&) const = default;
};

struct RenderTag {
    std::string type;
    std::string text;

    bool operator==(const RenderTag&) const = default;
};

/// Identifies one published version of a documentation archive
struct ArchiveVersion {
    std::string identifier;
    std::string display_name;

    bool operator==(const ArchiveVersion&) const = default;
};

/// Similar when the titles match; a retitled page replaces its metadata whole
struct RenderMetadata {
    std::optional<std::string> title;
    std::optional<std::string> role;
    std::optional<std::string> role_heading;
    std::optional<std::string> symbol_kind;
    std::optional<std::string> external_id;
    std::optional<immer::vector<Module>> modules;
    std::optional<DeclarationTokenList> fragments;
    std::optional<DeclarationTokenList> navigator_title;
    std::optional<immer::vector<PlatformAvailability>> platforms;
    std::optional<immer::vector<RenderTag>> tags;
    std::optional<ArchiveVersion> version;
    bool required = false;

    [[nodiscard]] bool is_similar(const RenderMetadata& other) const { return title == other.title; }
    RENDER_DIFF_API void difference_from(const RenderMetadata& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const RenderMetadata&) const = default;
};

[[nodiscard]] RENDER_DIFF_API Value to_value(const Module& mod);
[[nodiscard]] RENDER_DIFF_API Value to_value(const PlatformAvailability& platform);
[[nodiscard]] RENDER_DIFF_API Value to_value(const RenderTag& tag);
[[nodiscard]] RENDER_DIFF_API Value to_value(const ArchiveVersion& version);
[[nodiscard]] RENDER_DIFF_API Value to_value(const RenderMetadata& metadata);

} // namespace render_diff
