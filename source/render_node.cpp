// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/render_node.h>

namespace render_diff {

void SemanticVersion::difference_from(const SemanticVersion& previous, const Path& path, PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&SemanticVersion::major, "major")
        .add_difference(&SemanticVersion::minor, "minor")
        .add_difference(&SemanticVersion::patch, "patch")
        .add_difference(&SemanticVersion::prerelease, "prerelease")
        .add_difference(&SemanticVersion::build_metadata, "buildMetadata");
}

Value to_value(const SemanticVersion& version)
{
    return ObjectEncoder{}
        .field("major", version.major)
        .field("minor", version.minor)
        .field("patch", version.patch)
        .field("prerelease", version.prerelease)
        .field("buildMetadata", version.build_metadata)
        .finish();
}

std::string TopicIdentifier::url() const
{
    return "doc://" + bundle_identifier + path;
}

Value to_value(const TopicIdentifier& identifier)
{
    return ObjectEncoder{}
        .field("url", identifier.url())
        .field("interfaceLanguage", identifier.source_language)
        .finish();
}

std::string_view render_node_kind_name(RenderNodeKind kind)
{
    switch (kind) {
        case RenderNodeKind::Article:  return "article";
        case RenderNodeKind::Symbol:   return "symbol";
        case RenderNodeKind::Tutorial: return "tutorial";
        case RenderNodeKind::Section:  return "section";
        case RenderNodeKind::Overview: return "overview";
    }
    return "article";
}

std::optional<RenderNodeKind> render_node_kind_from_name(std::string_view name)
{
    if (name == "article") return RenderNodeKind::Article;
    if (name == "symbol") return RenderNodeKind::Symbol;
    if (name == "tutorial") return RenderNodeKind::Tutorial;
    if (name == "section") return RenderNodeKind::Section;
    if (name == "overview") return RenderNodeKind::Overview;
    return std::nullopt;
}

Value to_value(RenderNodeKind kind)
{
    return Value{render_node_kind_name(kind)};
}

void RenderNode::difference_from(const RenderNode& previous, const Path& path, PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&RenderNode::schema_version, "schemaVersion")
        .add_difference(&RenderNode::identifier, "identifier")
        .add_difference(&RenderNode::kind, "kind")
        .add_difference(&RenderNode::abstract, "abstract")
        .add_difference(&RenderNode::metadata, "metadata")
        .add_difference(&RenderNode::primary_content_sections, "primaryContentSections")
        .add_difference(&RenderNode::topic_sections, "topicSections")
        .add_difference(&RenderNode::see_also_sections, "seeAlsoSections")
        .add_difference(&RenderNode::references, "references");
}

Value to_value(const RenderNode& node)
{
    return ObjectEncoder{}
        .field("schemaVersion", node.schema_version)
        .field("identifier", node.identifier)
        .field("kind", node.kind)
        .field("abstract", node.abstract)
        .field("metadata", node.metadata)
        .field("primaryContentSections", node.primary_content_sections)
        .field("topicSections", node.topic_sections)
        .field("seeAlsoSections", node.see_also_sections)
        .field("references", node.references)
        .finish();
}

DiffResult diff_render_nodes(const RenderNode& previous, const RenderNode& current, const DiffOptions& options)
{
    return diff(previous, current, options);
}

} // namespace render_diff
