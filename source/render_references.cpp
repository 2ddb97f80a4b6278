// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/render_references.h>

namespace render_diff {

void TopicRenderReference::difference_from(const TopicRenderReference& previous, const Path& path,
                                           PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&TopicRenderReference::identifier, "identifier")
        .add_difference(&TopicRenderReference::title, "title")
        .add_difference(&TopicRenderReference::url, "url")
        .add_difference(&TopicRenderReference::kind_name, "kind")
        .add_difference(&TopicRenderReference::role, "role")
        .add_difference(&TopicRenderReference::abstract, "abstract");
}

Value to_value(const TopicRenderReference& reference)
{
    return ObjectEncoder{}
        .field("type", reference.kind())
        .field("identifier", reference.identifier)
        .field("title", reference.title)
        .field("url", reference.url)
        .field("kind", reference.kind_name)
        .field("role", reference.role)
        .field("abstract", reference.abstract)
        .finish();
}

Value to_value(const ImageVariant& variant)
{
    return ObjectEncoder{}
        .field("url", variant.url)
        .field("traits", variant.traits)
        .finish();
}

void ImageRenderReference::difference_from(const ImageRenderReference& previous, const Path& path,
                                           PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&ImageRenderReference::identifier, "identifier")
        .add_difference(&ImageRenderReference::alt, "alt")
        .add_difference(&ImageRenderReference::variants, "variants");
}

Value to_value(const ImageRenderReference& reference)
{
    return ObjectEncoder{}
        .field("type", reference.kind())
        .field("identifier", reference.identifier)
        .field("alt", reference.alt)
        .field("variants", reference.variants)
        .finish();
}

void LinkRenderReference::difference_from(const LinkRenderReference& previous, const Path& path,
                                          PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&LinkRenderReference::identifier, "identifier")
        .add_difference(&LinkRenderReference::title, "title")
        .add_difference(&LinkRenderReference::url, "url");
}

Value to_value(const LinkRenderReference& reference)
{
    return ObjectEncoder{}
        .field("type", reference.kind())
        .field("identifier", reference.identifier)
        .field("title", reference.title)
        .field("url", reference.url)
        .finish();
}

void UnresolvedRenderReference::difference_from(const UnresolvedRenderReference& previous, const Path& path,
                                                PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&UnresolvedRenderReference::identifier, "identifier")
        .add_difference(&UnresolvedRenderReference::title, "title");
}

Value to_value(const UnresolvedRenderReference& reference)
{
    return ObjectEncoder{}
        .field("type", reference.kind())
        .field("identifier", reference.identifier)
        .field("title", reference.title)
        .finish();
}

} // namespace render_diff
