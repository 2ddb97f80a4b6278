// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/render_metadata.h>

namespace render_diff {

void Module::difference_from(const Module& previous, const Path& path, PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&Module::name, "name")
        .add_difference(&Module::related_modules, "relatedModules");
}

Value to_value(const Module& mod)
{
    return ObjectEncoder{}
        .field("name", mod.name)
        .field("relatedModules", mod.related_modules)
        .finish();
}

void PlatformAvailability::difference_from(const PlatformAvailability& previous, const Path& path,
                                           PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&PlatformAvailability::name, "name")
        .add_difference(&PlatformAvailability::introduced_at, "introducedAt")
        .add_difference(&PlatformAvailability::deprecated, "deprecated")
        .add_difference(&PlatformAvailability::beta, "beta");
}

Value to_value(const PlatformAvailability& platform)
{
    return ObjectEncoder{}
        .field("name", platform.name)
        .field("introducedAt", platform.introduced_at)
        .field("deprecated", platform.deprecated)
        .field("beta", platform.beta)
        .finish();
}

Value to_value(const RenderTag& tag)
{
    return ObjectEncoder{}
        .field("type", tag.type)
        .field("text", tag.text)
        .finish();
}

Value to_value(const ArchiveVersion& version)
{
    return ObjectEncoder{}
        .field("identifier", version.identifier)
        .field("displayName", version.display_name)
        .finish();
}

void RenderMetadata::difference_from(const RenderMetadata& previous, const Path& path, PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&RenderMetadata::title, "title")
        .add_difference(&RenderMetadata::role, "role")
        .add_difference(&RenderMetadata::role_heading, "roleHeading")
        .add_difference(&RenderMetadata::symbol_kind, "symbolKind")
        .add_difference(&RenderMetadata::external_id, "externalID")
        .add_difference(&RenderMetadata::modules, "modules")
        .add_difference(&RenderMetadata::fragments, "fragments")
        .add_difference(&RenderMetadata::navigator_title, "navigatorTitle")
        .add_difference(&RenderMetadata::platforms, "platforms")
        .add_difference(&RenderMetadata::tags, "tags")
        .add_difference(&RenderMetadata::version, "version")
        .add_difference(&RenderMetadata::required, "required");
}

Value to_value(const RenderMetadata& metadata)
{
    return ObjectEncoder{}
        .field("title", metadata.title)
        .field("role", metadata.role)
        .field("roleHeading", metadata.role_heading)
        .field("symbolKind", metadata.symbol_kind)
        .field("externalID", metadata.external_id)
        .field("modules", metadata.modules)
        .field("fragments", metadata.fragments)
        .field("navigatorTitle", metadata.navigator_title)
        .field("platforms", metadata.platforms)
        .field("tags", metadata.tags)
        .field("version", metadata.version)
        .field("required", metadata.required)
        .finish();
}

} // namespace render_diff
