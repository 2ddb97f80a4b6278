// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render_codec.h
/// @brief Decoding render nodes and navigation indexes from Value / JSON.
///
/// Encoding is `to_value(node)`; this header adds the reverse direction.
/// The decode_* functions throw RenderDecodeError; the *_from_* functions
/// catch it and report through an optional error string instead.
///
/// Section, reference and inline items with a tag this library does not
/// know decode into UnrecognizedKind and keep their raw Value.

#pragma once

#include <render_diff/api.h>
#include <render_diff/render_index.h>
#include <render_diff/render_node.h>
#include <render_diff/value.h>

#include <optional>
#include <stdexcept>
#include <string>

namespace render_diff {

/// Thrown by the decoders; pointer() names the offending node
class RENDER_DIFF_API RenderDecodeError : public std::runtime_error {
public:
    RenderDecodeError(std::string pointer, const std::string& message);

    [[nodiscard]] const std::string& pointer() const noexcept { return pointer_; }

private:
    std::string pointer_;
};

[[nodiscard]] RENDER_DIFF_API InlineContent decode_inline_content(const Value& value, const Path& path = {});
[[nodiscard]] RENDER_DIFF_API AnyRenderSection decode_render_section(const Value& value, const Path& path = {});
[[nodiscard]] RENDER_DIFF_API AnyRenderReference decode_render_reference(const Value& value, const Path& path = {});
[[nodiscard]] RENDER_DIFF_API RenderMetadata decode_render_metadata(const Value& value, const Path& path = {});
[[nodiscard]] RENDER_DIFF_API RenderNode decode_render_node(const Value& value);

/// @return std::nullopt on failure, with the message (including the pointer) in error_out
[[nodiscard]] RENDER_DIFF_API std::optional<RenderNode> render_node_from_value(const Value& value,
                                                                               std::string* error_out = nullptr);
[[nodiscard]] RENDER_DIFF_API std::optional<RenderNode> render_node_from_json(const std::string& json,
                                                                              std::string* error_out = nullptr);

[[nodiscard]] RENDER_DIFF_API std::string render_node_to_json(const RenderNode& node, bool compact = false);

// ============================================================
// Navigation index
// ============================================================

/// Absent flags decode as false
[[nodiscard]] RENDER_DIFF_API RenderIndexNode decode_render_index_node(const Value& value, const Path& path = {});
[[nodiscard]] RENDER_DIFF_API RenderIndex decode_render_index(const Value& value);

[[nodiscard]] RENDER_DIFF_API std::optional<RenderIndex> render_index_from_json(const std::string& json,
                                                                                std::string* error_out = nullptr);
[[nodiscard]] RENDER_DIFF_API std::string render_index_to_json(const RenderIndex& index, bool compact = false);

} // namespace render_diff
