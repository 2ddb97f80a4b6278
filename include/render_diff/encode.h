// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file encode.h
/// @brief Encoding of model types into Value.
///
/// Every diffable type provides `Value to_value(const T&)` in namespace
/// render_diff. Scalar overloads are declared first and the container
/// templates are declared before any of them is defined, so that nested
/// containers (an optional vector of strings) resolve correctly.
///
/// Usage:
/// @code
///   Value to_value(const RenderTag& tag)
///   {
///       return ObjectEncoder{}
///           .field("type", tag.type)
///           .field("text", tag.text)
///           .finish();
///   }
/// @endcode

#pragma once

#include <render_diff/builders.h>
#include <render_diff/value.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace render_diff {

// ============================================================
// Scalars
// ============================================================

[[nodiscard]] inline Value to_value(const Value& v) { return v; }
[[nodiscard]] inline Value to_value(const std::string& v) { return Value{v}; }
[[nodiscard]] inline Value to_value(const char* v) { return Value{v}; }
[[nodiscard]] inline Value to_value(std::string_view v) { return Value{v}; }
[[nodiscard]] inline Value to_value(bool v) { return Value{v}; }
[[nodiscard]] inline Value to_value(int v) { return Value{v}; }
[[nodiscard]] inline Value to_value(int64_t v) { return Value{v}; }
[[nodiscard]] inline Value to_value(double v) { return Value{v}; }

// ============================================================
// Containers (declarations)
// ============================================================

/// Empty optional encodes as null
template <typename T>
[[nodiscard]] Value to_value(const std::optional<T>& v);

template <typename T>
[[nodiscard]] Value to_value(const immer::vector<T>& v);

template <typename T>
[[nodiscard]] Value to_value(const immer::map<std::string, T>& v);

/// Boxes break recursive models (an index node holding its children)
template <typename T>
[[nodiscard]] Value to_value(const immer::box<T>& v);

// ============================================================
// Containers (definitions)
// ============================================================

template <typename T>
Value to_value(const std::optional<T>& v)
{
    if (!v) {
        return Value{};
    }
    return to_value(*v);
}

template <typename T>
Value to_value(const immer::vector<T>& v)
{
    VectorBuilder builder;
    for (const auto& elem : v) {
        builder.push_back(to_value(elem));
    }
    return builder.finish();
}

template <typename T>
Value to_value(const immer::map<std::string, T>& v)
{
    MapBuilder builder;
    for (const auto& [key, elem] : v) {
        builder.set(key, to_value(elem));
    }
    return builder.finish();
}

template <typename T>
Value to_value(const immer::box<T>& v)
{
    return to_value(v.get());
}

// ============================================================
// ObjectEncoder
// ============================================================

/// Builds the map encoding of a struct, one field at a time.
/// An empty optional field is omitted from the object.
class ObjectEncoder {
public:
    template <typename T>
    ObjectEncoder& field(const std::string& key, const T& v) {
        builder_.set(key, to_value(v));
        return *this;
    }

    template <typename T>
    ObjectEncoder& field(const std::string& key, const std::optional<T>& v) {
        if (v) {
            builder_.set(key, to_value(*v));
        }
        return *this;
    }

    [[nodiscard]] Value finish() { return builder_.finish(); }

private:
    MapBuilder builder_;
};

} // namespace render_diff
