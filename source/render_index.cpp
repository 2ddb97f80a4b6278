// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/render_index.h>

#include <immer/vector_transient.hpp>

namespace render_diff {

std::string_view render_index_change_name(RenderIndexChange change)
{
    switch (change) {
        case RenderIndexChange::Added:      return "added";
        case RenderIndexChange::Modified:   return "modified";
        case RenderIndexChange::Deprecated: return "deprecated";
    }
    return "modified";
}

std::optional<RenderIndexChange> render_index_change_from_name(std::string_view name)
{
    for (auto change : {RenderIndexChange::Added, RenderIndexChange::Modified, RenderIndexChange::Deprecated}) {
        if (render_index_change_name(change) == name) {
            return change;
        }
    }
    return std::nullopt;
}

Value to_value(RenderIndexChange change)
{
    return Value{render_index_change_name(change)};
}

// ============================================================
// Nodes
// ============================================================

RenderIndexNodeList make_index_nodes(std::initializer_list<RenderIndexNode> nodes)
{
    auto list = RenderIndexNodeList{}.transient();
    for (const auto& node : nodes) {
        list.push_back(immer::box<RenderIndexNode>{node});
    }
    return list.persistent();
}

namespace {

// Flags are only written when set, so they diff as present or absent
std::optional<bool> flag(bool value)
{
    return value ? std::optional<bool>{true} : std::nullopt;
}

} // namespace

bool RenderIndexNode::is_similar(const RenderIndexNode& other) const
{
    return title == other.title ||
           (children && children == other.children) ||
           (path && path == other.path) ||
           (type && type == other.type);
}

void RenderIndexNode::difference_from(const RenderIndexNode& previous, const Path& path,
                                      PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&RenderIndexNode::title, "title")
        .add_difference(&RenderIndexNode::path, "path")
        .add_difference(&RenderIndexNode::type, "type")
        .add_difference(&RenderIndexNode::children, "children")
        .add_difference("deprecated", [](const RenderIndexNode& node) { return flag(node.deprecated); })
        .add_difference("external", [](const RenderIndexNode& node) { return flag(node.external); })
        .add_difference("beta", [](const RenderIndexNode& node) { return flag(node.beta); });
}

Value to_value(const RenderIndexNode& node)
{
    return ObjectEncoder{}
        .field("title", node.title)
        .field("path", node.path)
        .field("type", node.type)
        .field("children", node.children)
        .field("deprecated", flag(node.deprecated))
        .field("external", flag(node.external))
        .field("beta", flag(node.beta))
        .finish();
}

// ============================================================
// Index
// ============================================================

Value to_value(const RenderIndexMetadata& metadata)
{
    return ObjectEncoder{}
        .field("version", metadata.version)
        .finish();
}

void RenderIndex::difference_from(const RenderIndex& previous, const Path& path, PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&RenderIndex::schema_version, "schemaVersion")
        .add_difference(&RenderIndex::interface_languages, "interfaceLanguages")
        .add_difference(&RenderIndex::metadata, "metadata");
}

Value to_value(const RenderIndex& index)
{
    return ObjectEncoder{}
        .field("schemaVersion", index.schema_version)
        .field("interfaceLanguages", index.interface_languages)
        .field("metadata", index.metadata)
        .field("versionDifferences", index.version_differences)
        .finish();
}

DiffResult diff_render_indexes(const RenderIndex& previous, const RenderIndex& current, const DiffOptions& options)
{
    return diff(previous, current, options);
}

} // namespace render_diff
