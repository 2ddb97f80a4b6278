// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) rendering and parsing for Path.
///
///   "/references/doc:~1~1a/title"  <->  ["references", "doc://a", "title"]
///
/// RFC 6901: https://datatracker.ietf.org/doc/html/rfc6901
///
/// - The empty pointer "" refers to the whole document
/// - Every other pointer is a sequence of "/"-prefixed reference tokens
/// - Escape sequences: "~0" -> "~", "~1" -> "/"
/// - Path keeps keys and indices apart, so a key that looks numeric and a
///   real index render to the same text but never collide in the model

#pragma once

#include <render_diff/lager_lens.h>
#include <render_diff/value.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace render_diff {

// ============================================================
// Reference tokens
// ============================================================

/// Escape one reference token: "~" -> "~0", "/" -> "~1"
[[nodiscard]] RENDER_DIFF_API std::string escape_pointer_token(std::string_view token);

/// Unescape one reference token
/// @return std::nullopt when "~" is not followed by '0' or '1'
[[nodiscard]] RENDER_DIFF_API std::optional<std::string> unescape_pointer_token(std::string_view token,
                                                                                 std::string* error_out = nullptr);

/// True for canonical array indices: "0" or a digit string without a leading zero
[[nodiscard]] RENDER_DIFF_API bool is_array_index_token(std::string_view token);

struct PointerParseResult {
    std::vector<std::string> tokens;    // Unescaped reference tokens
    bool success = false;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }
};

/// Split a pointer into its unescaped reference tokens
[[nodiscard]] RENDER_DIFF_API PointerParseResult split_json_pointer(std::string_view pointer);

// ============================================================
// Path <-> pointer
// ============================================================

/// Render a Path as a JSON Pointer; the empty path renders as ""
[[nodiscard]] RENDER_DIFF_API std::string path_to_json_pointer(const Path& path);

/// Parse a JSON Pointer into a Path; canonical index tokens become indices
/// @return std::nullopt (and a message in error_out) for malformed pointers
[[nodiscard]] RENDER_DIFF_API std::optional<Path> try_parse_json_pointer(std::string_view pointer,
                                                                          std::string* error_out = nullptr);

// Examples:
//   "/metadata/title"     -> ["metadata", "title"]
//   "/topicSections/0"    -> ["topicSections", 0]
//   ""                    -> []  (root)
//   "/"                   -> [""]  (key is empty string)

// ============================================================
// Pointer-addressed access
// ============================================================
// A malformed pointer is logged and addresses nothing: reads yield null and
// writes return the document unchanged.

// Returns null Value if path not found
[[nodiscard]] RENDER_DIFF_API Value get_by_pointer(const Value& data, std::string_view pointer);

// Returns new immutable Value with the change applied
[[nodiscard]] RENDER_DIFF_API Value set_by_pointer(const Value& data, std::string_view pointer, Value new_value);

template<typename Fn>
requires ValueTransformer<Fn, Value>
[[nodiscard]] Value over_by_pointer(const Value& data, std::string_view pointer, Fn&& fn)
{
    std::string error;
    auto path = try_parse_json_pointer(pointer, &error);
    if (!path) {
        detail::log_access_error("over_by_pointer", error);
        return data;
    }
    return lager::over(value_path_lens(*path), data, std::forward<Fn>(fn));
}

} // namespace render_diff
