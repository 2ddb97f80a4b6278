// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render_index.h
/// @brief The archive's navigation index and its diff.
///
/// The index maps each interface language to a tree of nodes, one node per
/// page or group in the navigator. Two versions of an index diff the same
/// way two pages do:
///
/// @code
///   DiffResult result = diff_render_indexes(previous_index, current_index);
///   // [{"op":"replace","path":"/interfaceLanguages/swift/0/children/1/title", ...}]
/// @endcode

#pragma once

#include <render_diff/api.h>
#include <render_diff/diff_collector.h>
#include <render_diff/render_metadata.h>
#include <render_diff/render_node.h>
#include <render_diff/value_diff.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace render_diff {

// ============================================================
// Version differences
// ============================================================

/// How a page changed since an earlier archive version
enum class RenderIndexChange {
    Added,
    Modified,
    Deprecated,
};

/// "added", "modified" or "deprecated"
[[nodiscard]] RENDER_DIFF_API std::string_view render_index_change_name(RenderIndexChange change);
[[nodiscard]] RENDER_DIFF_API std::optional<RenderIndexChange> render_index_change_from_name(std::string_view name);
[[nodiscard]] RENDER_DIFF_API Value to_value(RenderIndexChange change);

/// page path -> (version identifier -> change)
using VersionDifferences = immer::map<std::string, immer::map<std::string, RenderIndexChange>>;

// ============================================================
// Nodes
// ============================================================

struct RenderIndexNode;

/// Children are boxed: a node cannot hold a vector of itself directly
using RenderIndexNodeList = immer::vector<immer::box<RenderIndexNode>>;

[[nodiscard]] RENDER_DIFF_API RenderIndexNodeList make_index_nodes(std::initializer_list<RenderIndexNode> nodes);

/// One entry of the navigator tree.
/// Nodes match when their titles are equal, or when they share present
/// children, a present path or a present type.
struct RenderIndexNode {
    std::string title;
    std::optional<std::string> path;
    std::optional<std::string> type;
    std::optional<RenderIndexNodeList> children;
    bool deprecated = false;
    bool external = false;
    bool beta = false;

    [[nodiscard]] RENDER_DIFF_API bool is_similar(const RenderIndexNode& other) const;
    RENDER_DIFF_API void difference_from(const RenderIndexNode& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const RenderIndexNode&) const = default;
};

// ============================================================
// Index
// ============================================================

struct RenderIndexMetadata {
    ArchiveVersion version;

    bool operator==(const RenderIndexMetadata&) const = default;
};

/// Navigation index of a documentation archive
struct RenderIndex {
    SemanticVersion schema_version{0, 1, 0, std::nullopt, std::nullopt};
    immer::map<std::string, RenderIndexNodeList> interface_languages;
    std::optional<RenderIndexMetadata> metadata;
    std::optional<VersionDifferences> version_differences;

    /// Indexes of the same schema major version are diffed member by member
    [[nodiscard]] bool is_similar(const RenderIndex& other) const {
        return schema_version.major == other.schema_version.major;
    }
    RENDER_DIFF_API void difference_from(const RenderIndex& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const RenderIndex&) const = default;
};

/// False flags are omitted, as are absent path, type and children
[[nodiscard]] RENDER_DIFF_API Value to_value(const RenderIndexNode& node);
[[nodiscard]] RENDER_DIFF_API Value to_value(const RenderIndexMetadata& metadata);
[[nodiscard]] RENDER_DIFF_API Value to_value(const RenderIndex& index);

/// Patch turning @p previous into @p current
///
/// Schema version, interface languages and metadata are diffed; the
/// version differences table is carried but never diffed.
[[nodiscard]] RENDER_DIFF_API DiffResult diff_render_indexes(const RenderIndex& previous,
                                                             const RenderIndex& current,
                                                             const DiffOptions& options = {});

} // namespace render_diff
