// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON serialization for Value.
///
/// Usage:
/// @code
///   #include <render_diff/serialization.h>
///
///   std::string json = to_json(data, false);  // pretty-printed
///   Value parsed = from_json(json);
/// @endcode
///
/// Object members are written in sorted key order so that equal Values
/// always produce identical text.

#pragma once

#include "api.h"
#include "value.h"

#include <string>

namespace render_diff {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return JSON string representation
///
/// Doubles with an integral value keep a trailing ".0" so that they parse
/// back as doubles.
[[nodiscard]] RENDER_DIFF_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
[[nodiscard]] RENDER_DIFF_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace render_diff
