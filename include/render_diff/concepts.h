// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in render_diff.
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>
#include <type_traits>

namespace render_diff {

// ============================================================
// Path element concepts
// ============================================================

/// Types usable as map keys in a path
template<typename T>
concept KeyType = std::is_convertible_v<T, std::string_view>;

/// Types usable as sequence indices in a path
template<typename T>
concept IndexType = std::is_integral_v<std::decay_t<T>> &&
                    !std::is_same_v<std::decay_t<T>, bool>;

template<typename T>
concept PathElementType = KeyType<T> || IndexType<T>;

// ============================================================
// Callable Concepts
// ============================================================

/// Concept for update functions that transform a value
template<typename Fn, typename ValueType>
concept ValueTransformer = std::invocable<Fn, ValueType> &&
                           std::convertible_to<std::invoke_result_t<Fn, ValueType>, ValueType>;

// ============================================================
// Container Concepts
// ============================================================

/// Sized sequence with index access, as aligned by the sequence differ
template<typename T>
concept SequenceLike = requires(const T& t, std::size_t i) {
    { t.size() } -> std::convertible_to<std::size_t>;
    { t[i] };
};

} // namespace render_diff
