// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// lager_lens.h - Type-erased lenses using lager::lens<Value, Value>
//
// Lenses are how patch application reads a container out of a document and
// writes the edited container back into its parent.

#pragma once

#include <render_diff/api.h>
#include <render_diff/value.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>

#include <string>

namespace render_diff {

using LagerValueLens = lager::lens<Value, Value>;

/// @brief Build a type-erased lens that focuses on @p path
/// The empty path yields the identity lens. Writing through a path whose
/// members do not exist leaves the document unchanged.
[[nodiscard]] RENDER_DIFF_API LagerValueLens value_path_lens(const Path& path);

// ============================================================
// Checked path access
// ============================================================

enum class PathErrorCode {
    Success = 0,
    KeyNotFound,        // Map key doesn't exist
    IndexOutOfRange,    // Vector index out of bounds
    TypeMismatch,       // Expected container type, got primitive
    NullValue,          // Attempted access on null value
    EmptyPath,          // Operation needs a parent but addressed the root
    InvalidPointer,     // Malformed JSON Pointer text or index token
};

struct PathAccessResult {
    Value value;                    // The accessed value (or null on error)
    bool success = false;
    PathErrorCode error_code = PathErrorCode::Success;
    std::string error_message;
    Path resolved_path;             // The portion of path that was successfully resolved
    std::size_t failed_at_index = 0;

    explicit operator bool() const noexcept { return success; }
};

[[nodiscard]] RENDER_DIFF_API std::string path_error_message(PathErrorCode code, const PathElement& elem, std::size_t index);

/// Read the value at @p path, recording where traversal stopped on failure
[[nodiscard]] RENDER_DIFF_API PathAccessResult get_at_path_safe(const Value& root, const Path& path);

} // namespace render_diff
