// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render_content.h
/// @brief Inline content of rendered documentation (text runs, code voice, references).
///
/// Inline items are tagged by the "type" key on the wire:
/// @code
///   {"type":"text","text":"Returns the "}
///   {"type":"codeVoice","code":"count"}
///   {"type":"reference","identifier":"doc://org.swift.docc/Array","isActive":true}
/// @endcode

#pragma once

#include <render_diff/api.h>
#include <render_diff/kind_variant.h>
#include <render_diff/value.h>

#include <immer/vector.hpp>

#include <string>
#include <string_view>

namespace render_diff {

struct TextInline {
    std::string text;

    [[nodiscard]] std::string_view kind() const noexcept { return "text"; }
    bool operator==(const TextInline&) const = default;
};

struct CodeVoiceInline {
    std::string code;

    [[nodiscard]] std::string_view kind() const noexcept { return "codeVoice"; }
    bool operator==(const CodeVoiceInline&) const = default;
};

/// Link to another topic; similar when it points at the same identifier
struct ReferenceInline {
    std::string identifier;
    bool is_active = true;

    [[nodiscard]] std::string_view kind() const noexcept { return "reference"; }
    [[nodiscard]] bool is_similar(const ReferenceInline& other) const { return identifier == other.identifier; }
    RENDER_DIFF_API void difference_from(const ReferenceInline& previous, const Path& path, PatchCollector& out) const;
    bool operator==(const ReferenceInline&) const = default;
};

using InlineContent = KindVariant<TextInline, CodeVoiceInline, ReferenceInline, UnrecognizedKind>;
using InlineContentList = immer::vector<InlineContent>;

[[nodiscard]] RENDER_DIFF_API Value to_value(const TextInline& item);
[[nodiscard]] RENDER_DIFF_API Value to_value(const CodeVoiceInline& item);
[[nodiscard]] RENDER_DIFF_API Value to_value(const ReferenceInline& item);

/// Concatenated plain text of an inline list (code voice included, references skipped)
[[nodiscard]] RENDER_DIFF_API std::string plain_text(const InlineContentList& content);

} // namespace render_diff
