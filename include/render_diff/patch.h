// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief RFC 6902 JSON Patch model, wire codec and application.
///
/// Wire format (an array of operation objects):
/// @code
///   {"op":"add",     "path":"<pointer>", "value": <any>}
///   {"op":"remove",  "path":"<pointer>"}
///   {"op":"replace", "path":"<pointer>", "value": <any>}
/// @endcode
///
/// Operations are applied in order. Array indices are interpreted against
/// the array as left by the operations before them.

#pragma once

#include <render_diff/api.h>
#include <render_diff/json_pointer.h>
#include <render_diff/lager_lens.h>
#include <render_diff/value.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace render_diff {

struct PatchOperation {
    enum class Type { Add, Remove, Replace };

    Type type = Type::Add;
    Path path;      // Always resolved from the document root
    Value value;    // Self-contained snapshot; null for Remove

    [[nodiscard]] static PatchOperation add(Path path, Value value) {
        return PatchOperation{Type::Add, std::move(path), std::move(value)};
    }

    [[nodiscard]] static PatchOperation remove(Path path) {
        return PatchOperation{Type::Remove, std::move(path), Value{}};
    }

    [[nodiscard]] static PatchOperation replace(Path path, Value value) {
        return PatchOperation{Type::Replace, std::move(path), std::move(value)};
    }

    [[nodiscard]] std::string pointer() const { return path_to_json_pointer(path); }

    bool operator==(const PatchOperation&) const = default;
};

using Patch = std::vector<PatchOperation>;

/// "add", "remove" or "replace"
[[nodiscard]] RENDER_DIFF_API std::string_view patch_op_name(PatchOperation::Type type);
[[nodiscard]] RENDER_DIFF_API std::optional<PatchOperation::Type> patch_op_from_name(std::string_view name);

// ============================================================
// Wire codec
// ============================================================

[[nodiscard]] RENDER_DIFF_API Value patch_to_value(const Patch& patch);
[[nodiscard]] RENDER_DIFF_API std::string patch_to_json(const Patch& patch, bool compact = true);

/// @return std::nullopt (and a message in error_out) if the Value is not a valid patch
[[nodiscard]] RENDER_DIFF_API std::optional<Patch> patch_from_value(const Value& value, std::string* error_out = nullptr);
[[nodiscard]] RENDER_DIFF_API std::optional<Patch> patch_from_json(const std::string& json, std::string* error_out = nullptr);

// ============================================================
// Patch application
// ============================================================

struct PatchApplyError {
    std::size_t operation_index = 0;
    PathErrorCode code = PathErrorCode::Success;
    std::string pointer;
    std::string message;
};

struct PatchApplyResult {
    Value value;                            // Document after every applicable operation
    std::vector<PatchApplyError> errors;    // One entry per skipped operation

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
    explicit operator bool() const noexcept { return ok(); }
};

/// Apply @p patch to @p document.
///
/// An operation whose pointer does not resolve is skipped and reported in
/// PatchApplyResult::errors; the operations before it stay applied and the
/// ones after it still run. Each path element is resolved against the
/// container it addresses: an index on a map is used as its decimal key,
/// a canonical index token on a vector is an index, and "-" appends.
[[nodiscard]] RENDER_DIFF_API PatchApplyResult apply_patch(const Value& document, const Patch& patch);

/// Print one line per operation to stdout
RENDER_DIFF_API void print_patch(const Patch& patch);

} // namespace render_diff
