// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render_sections.h
/// @brief Page sections: prose content, declarations, task groups and parameters.
///
/// Sections are tagged by the "kind" key on the wire. The family is closed:
/// adding a section kind means adding one alternative to AnyRenderSection.

#pragma once

#include <render_diff/api.h>
#include <render_diff/kind_variant.h>
#include <render_diff/render_content.h>

#include <immer/vector.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace render_diff {

// ============================================================
// Declarations
// ============================================================

enum class TokenKind {
    Keyword,
    Attribute,
    Number,
    String,
    Identifier,
    TypeIdentifier,
    GenericParameter,
    Text,
    InternalParam,
    ExternalParam,
    Label,
};

[[nodiscard]] RENDER_DIFF_API std::string_view token_kind_name(TokenKind kind);
[[nodiscard]] RENDER_DIFF_API std::optional<TokenKind> token_kind_from_name(std::string_view name);
[[nodiscard]] RENDER_DIFF_API Value to_value(TokenKind kind);

/// One fragment of a symbol declaration; similar when the text matches
struct DeclarationToken {
    std::string text;
    TokenKind kind = TokenKind::Text;
    std::optional<std::string> identifier;
    std::optional<std::string> precise_identifier;

    [[nodiscard]] bool is_similar(const DeclarationToken& other) const { return text == other.text; }
    RENDER_DIFF_API void difference_from(const DeclarationToken& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const DeclarationToken&) const = default;
};

using DeclarationTokenList = immer::vector<DeclarationToken>;

/// A declaration for a set of platforms; similar when the tokens match
struct DeclarationRenderSection {
    DeclarationTokenList tokens;
    immer::vector<std::string> platforms;
    std::optional<immer::vector<std::string>> languages;

    [[nodiscard]] bool is_similar(const DeclarationRenderSection& other) const { return tokens == other.tokens; }
    RENDER_DIFF_API void difference_from(const DeclarationRenderSection& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const DeclarationRenderSection&) const = default;
};

// ============================================================
// Section kinds
// ============================================================

struct ContentRenderSection {
    std::optional<std::string> heading;
    InlineContentList content;

    [[nodiscard]] std::string_view kind() const noexcept { return "content"; }
    [[nodiscard]] bool is_similar(const ContentRenderSection&) const { return true; }
    RENDER_DIFF_API void difference_from(const ContentRenderSection& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const ContentRenderSection&) const = default;
};

struct DeclarationsRenderSection {
    immer::vector<DeclarationRenderSection> declarations;

    [[nodiscard]] std::string_view kind() const noexcept { return "declarations"; }
    [[nodiscard]] bool is_similar(const DeclarationsRenderSection&) const { return true; }
    RENDER_DIFF_API void difference_from(const DeclarationsRenderSection& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const DeclarationsRenderSection&) const = default;
};

/// A titled group of links to child topics.
/// Two groups are the same group when they share a present title, a present
/// abstract or the identifier list. Absent titles never match each other.
struct TaskGroupRenderSection {
    std::optional<std::string> title;
    std::optional<InlineContentList> abstract;
    immer::vector<std::string> identifiers;
    bool generated = false;

    [[nodiscard]] std::string_view kind() const noexcept { return "taskGroup"; }
    [[nodiscard]] RENDER_DIFF_API bool is_similar(const TaskGroupRenderSection& other) const;
    RENDER_DIFF_API void difference_from(const TaskGroupRenderSection& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const TaskGroupRenderSection&) const = default;
};

struct ParameterRenderSection {
    std::string name;
    InlineContentList content;

    [[nodiscard]] bool is_similar(const ParameterRenderSection& other) const { return name == other.name; }
    RENDER_DIFF_API void difference_from(const ParameterRenderSection& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const ParameterRenderSection&) const = default;
};

struct ParametersRenderSection {
    immer::vector<ParameterRenderSection> parameters;

    [[nodiscard]] std::string_view kind() const noexcept { return "parameters"; }
    [[nodiscard]] bool is_similar(const ParametersRenderSection&) const { return true; }
    RENDER_DIFF_API void difference_from(const ParametersRenderSection& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const ParametersRenderSection&) const = default;
};

using AnyRenderSection = KindVariant<ContentRenderSection,
                                     DeclarationsRenderSection,
                                     TaskGroupRenderSection,
                                     ParametersRenderSection,
                                     UnrecognizedKind>;

using RenderSectionList = immer::vector<AnyRenderSection>;

[[nodiscard]] RENDER_DIFF_API Value to_value(const DeclarationToken& token);
[[nodiscard]] RENDER_DIFF_API Value to_value(const DeclarationRenderSection& section);
[[nodiscard]] RENDER_DIFF_API Value to_value(const ContentRenderSection& section);
[[nodiscard]] RENDER_DIFF_API Value to_value(const DeclarationsRenderSection& section);
[[nodiscard]] RENDER_DIFF_API Value to_value(const TaskGroupRenderSection& section);
[[nodiscard]] RENDER_DIFF_API Value to_value(const ParameterRenderSection& parameter);
[[nodiscard]] RENDER_DIFF_API Value to_value(const ParametersRenderSection& section);

} // namespace render_diff
