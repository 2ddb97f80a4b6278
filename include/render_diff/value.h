// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief JSON-like dynamic Value type used for encoded render trees and patch payloads.
///
/// A Value can represent:
/// - Primitive types: int64, double, bool, string
/// - Container types: map and vector (immer's persistent containers)
/// - Null (std::monostate)
///
/// The Value type is templated on a memory policy. render_diff uses immer's
/// default (thread-safe) policy because encoded snapshots are shared between
/// diff workers.

#pragma once

#include "render_diff_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>

#include <cstdint>
#include <iostream>
#include <source_location> // for std::source_location (C++20)
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace render_diff {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RENDER_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RENDER_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if RENDER_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

} // namespace render_diff (temporary close for include)

#include <render_diff/concepts.h>

namespace render_diff {

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                  BasicValueBox<MemoryPolicy>,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;

// flex_vector so that patch application can insert and erase in the middle
template <typename MemoryPolicy>
using BasicValueVector = immer::flex_vector<BasicValueBox<MemoryPolicy>,
                                             MemoryPolicy>;

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;

    std::variant<int64_t,
                 double,
                 bool,
                 std::string,
                 value_map,
                 value_vector,
                 std::monostate>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(int v) noexcept : data(static_cast<int64_t>(v)) {}
    constexpr BasicValue(int64_t v) noexcept : data(v) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    explicit BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}

    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }

    /// Lookup without logging; nullptr when absent or not a map
    [[nodiscard]] const BasicValue* find(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return &found->get();
        }
        return nullptr;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* found = find(key)) return *found;
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "out of range or non-vector type");
        return *this;
    }

    /// Insert before @p index; index == size() appends
    [[nodiscard]] BasicValue insert(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index <= v->size()) return v->insert(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::insert", index, "out of range or non-vector type");
        return *this;
    }

    [[nodiscard]] BasicValue erase(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->erase(key);
        detail::log_key_error("Value::erase", key, "cannot erase from non-map type");
        return *this;
    }

    [[nodiscard]] BasicValue erase(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->erase(index);
        }
        detail::log_index_error("Value::erase", index, "out of range or non-vector type");
        return *this;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        return 0;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy
// ============================================================

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

using Value       = BasicValue<thread_safe_memory_policy>;
using ValueBox    = BasicValueBox<thread_safe_memory_policy>;
using ValueMap    = BasicValueMap<thread_safe_memory_policy>;
using ValueVector = BasicValueVector<thread_safe_memory_policy>;

/// Equality comparison for BasicValue
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Path helpers
// ============================================================

template <PathElementType E>
[[nodiscard]] PathElement to_path_element(E&& elem)
{
    if constexpr (IndexType<E>) {
        return static_cast<std::size_t>(elem);
    } else {
        return std::string{std::string_view{elem}};
    }
}

/// Build a Path from keys and indices: make_path("tags", 0)
template <PathElementType... Elems>
[[nodiscard]] Path make_path(Elems&&... elems)
{
    Path path;
    path.reserve(sizeof...(Elems));
    (path.push_back(to_path_element(std::forward<Elems>(elems))), ...);
    return path;
}

/// Paths are never edited in place while diffing; descending yields a new path
[[nodiscard]] inline Path append_path(const Path& base, PathElement element)
{
    Path result;
    result.reserve(base.size() + 1);
    result.insert(result.end(), base.begin(), base.end());
    result.push_back(std::move(element));
    return result;
}

// ============================================================
// Utility functions
// ============================================================

// Name of the stored alternative ("string", "map", ...)
[[nodiscard]] RENDER_DIFF_API std::string_view value_type_name(const Value& val);

// ============================================================
// Extern Template Declarations
//
// The instantiation lives in value.cpp.
// ============================================================

RENDER_DIFF_EXTERN_TEMPLATE struct BasicValue<thread_safe_memory_policy>;

} // namespace render_diff
