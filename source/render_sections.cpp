// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/render_sections.h>

#include <array>
#include <utility>

namespace render_diff {

namespace {

constexpr std::array<std::pair<TokenKind, std::string_view>, 11> token_kind_names{{
    {TokenKind::Keyword,          "keyword"},
    {TokenKind::Attribute,        "attribute"},
    {TokenKind::Number,           "number"},
    {TokenKind::String,           "string"},
    {TokenKind::Identifier,       "identifier"},
    {TokenKind::TypeIdentifier,   "typeIdentifier"},
    {TokenKind::GenericParameter, "genericParameter"},
    {TokenKind::Text,             "text"},
    {TokenKind::InternalParam,    "internalParam"},
    {TokenKind::ExternalParam,    "externalParam"},
    {TokenKind::Label,            "label"},
}};

} // anonymous namespace

std::string_view token_kind_name(TokenKind kind)
{
    for (const auto& [k, name] : token_kind_names) {
        if (k == kind) return name;
    }
    return "text";
}

std::optional<TokenKind> token_kind_from_name(std::string_view name)
{
    for (const auto& [k, n] : token_kind_names) {
        if (n == name) return k;
    }
    return std::nullopt;
}

Value to_value(TokenKind kind)
{
    return Value{token_kind_name(kind)};
}

// ============================================================
// Declarations
// ============================================================

void DeclarationToken::difference_from(const DeclarationToken& previous, const Path& path, PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&DeclarationToken::text, "text")
        .add_difference(&DeclarationToken::kind, "kind")
        .add_difference(&DeclarationToken::identifier, "identifier")
        .add_difference(&DeclarationToken::precise_identifier, "preciseIdentifier");
}

Value to_value(const DeclarationToken& token)
{
    return ObjectEncoder{}
        .field("text", token.text)
        .field("kind", token.kind)
        .field("identifier", token.identifier)
        .field("preciseIdentifier", token.precise_identifier)
        .finish();
}

void DeclarationRenderSection::difference_from(const DeclarationRenderSection& previous, const Path& path,
                                               PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&DeclarationRenderSection::tokens, "tokens")
        .add_difference(&DeclarationRenderSection::platforms, "platforms")
        .add_difference(&DeclarationRenderSection::languages, "languages");
}

Value to_value(const DeclarationRenderSection& section)
{
    return ObjectEncoder{}
        .field("tokens", section.tokens)
        .field("platforms", section.platforms)
        .field("languages", section.languages)
        .finish();
}

// ============================================================
// Section kinds
// ============================================================

void ContentRenderSection::difference_from(const ContentRenderSection& previous, const Path& path,
                                           PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&ContentRenderSection::heading, "heading")
        .add_difference(&ContentRenderSection::content, "content");
}

Value to_value(const ContentRenderSection& section)
{
    return ObjectEncoder{}
        .field("kind", section.kind())
        .field("heading", section.heading)
        .field("content", section.content)
        .finish();
}

void DeclarationsRenderSection::difference_from(const DeclarationsRenderSection& previous, const Path& path,
                                                PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&DeclarationsRenderSection::declarations, "declarations");
}

Value to_value(const DeclarationsRenderSection& section)
{
    return ObjectEncoder{}
        .field("kind", section.kind())
        .field("declarations", section.declarations)
        .finish();
}

bool TaskGroupRenderSection::is_similar(const TaskGroupRenderSection& other) const
{
    return (title && title == other.title) ||
           (abstract && abstract == other.abstract) ||
           identifiers == other.identifiers;
}

void TaskGroupRenderSection::difference_from(const TaskGroupRenderSection& previous, const Path& path,
                                             PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&TaskGroupRenderSection::title, "title")
        .add_difference(&TaskGroupRenderSection::abstract, "abstract")
        .add_difference(&TaskGroupRenderSection::identifiers, "identifiers")
        .add_difference(&TaskGroupRenderSection::generated, "generated");
}

Value to_value(const TaskGroupRenderSection& section)
{
    return ObjectEncoder{}
        .field("kind", section.kind())
        .field("title", section.title)
        .field("abstract", section.abstract)
        .field("identifiers", section.identifiers)
        .field("generated", section.generated)
        .finish();
}

void ParameterRenderSection::difference_from(const ParameterRenderSection& previous, const Path& path,
                                             PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&ParameterRenderSection::name, "name")
        .add_difference(&ParameterRenderSection::content, "content");
}

Value to_value(const ParameterRenderSection& parameter)
{
    return ObjectEncoder{}
        .field("name", parameter.name)
        .field("content", parameter.content)
        .finish();
}

void ParametersRenderSection::difference_from(const ParametersRenderSection& previous, const Path& path,
                                              PatchCollector& out) const
{
    DifferenceBuilder{previous, *this, path, out}
        .add_difference(&ParametersRenderSection::parameters, "parameters");
}

Value to_value(const ParametersRenderSection& section)
{
    return ObjectEncoder{}
        .field("kind", section.kind())
        .field("parameters", section.parameters)
        .finish();
}

} // namespace render_diff
