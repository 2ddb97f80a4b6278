// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Structural diff of typed models into a JSON Patch.
///
/// Every pair of values is handled by the three-way rule:
///   1. equal             -> no operation
///   2. similar           -> recurse and emit finer operations
///   3. otherwise         -> one Replace with the current value
///
/// Optionals, string-keyed maps and sequences have dedicated rules (see
/// the diff_value overloads below). Composite models implement
/// `is_similar` and `difference_from`, usually with DifferenceBuilder:
///
/// @code
///   void Page::difference_from(const Page& previous, const Path& path,
///                              PatchCollector& out) const
///   {
///       DifferenceBuilder{previous, *this, path, out}
///           .add_difference(&Page::title, "title")
///           .add_difference(&Page::tags, "tags");
///   }
///
///   DiffResult result = diff(old_page, new_page);
///   std::string json = patch_to_json(result.patch);
/// @endcode

#pragma once

#include <render_diff/diff_collector.h>
#include <render_diff/encode.h>
#include <render_diff/sequence_diff.h>
#include <render_diff/value.h>

#include <immer/algorithm.hpp>
#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace render_diff {

// ============================================================
// Concepts
// ============================================================

/// Type with its own notion of "same entity, possibly edited"
template <typename T>
concept HasSimilarity = requires(const T& a, const T& b) {
    { a.is_similar(b) } -> std::convertible_to<bool>;
};

/// Composite type that knows how to diff its own fields
template <typename T>
concept StructurallyDiffable = HasSimilarity<T> && std::equality_comparable<T> &&
    requires(const T& current, const T& previous, const Path& path, PatchCollector& out) {
        current.difference_from(previous, path, out);
    };

// ============================================================
// Similarity policy (declarations)
// ============================================================

/// Leaves: equality. Composites: is_similar.
template <typename T>
[[nodiscard]] bool values_similar(const T& a, const T& b);

/// Both empty, or both engaged and similar
template <typename T>
[[nodiscard]] bool values_similar(const std::optional<T>& a, const std::optional<T>& b);

/// Sequences and maps are always diffed structurally
template <typename T>
[[nodiscard]] bool values_similar(const immer::vector<T>& a, const immer::vector<T>& b);

template <typename T>
[[nodiscard]] bool values_similar(const immer::map<std::string, T>& a, const immer::map<std::string, T>& b);

/// A box compares and diffs as the value it holds
template <typename T>
[[nodiscard]] bool values_similar(const immer::box<T>& a, const immer::box<T>& b);

// ============================================================
// Diff rules (declarations)
// ============================================================

template <typename T>
void diff_value(const T& previous, const T& current, const Path& path, PatchCollector& out);

template <typename T>
void diff_value(const std::optional<T>& previous, const std::optional<T>& current,
                const Path& path, PatchCollector& out);

template <typename T>
void diff_value(const immer::vector<T>& previous, const immer::vector<T>& current,
                const Path& path, PatchCollector& out);

template <typename T>
void diff_value(const immer::map<std::string, T>& previous, const immer::map<std::string, T>& current,
                const Path& path, PatchCollector& out);

template <typename T>
void diff_value(const immer::box<T>& previous, const immer::box<T>& current,
                const Path& path, PatchCollector& out);

// ============================================================
// Similarity policy (definitions)
// ============================================================

template <typename T>
bool values_similar(const T& a, const T& b)
{
    if constexpr (HasSimilarity<T>) {
        return a.is_similar(b);
    } else {
        return a == b;
    }
}

template <typename T>
bool values_similar(const std::optional<T>& a, const std::optional<T>& b)
{
    if (!a || !b) {
        return !a && !b;
    }
    return values_similar(*a, *b);
}

template <typename T>
bool values_similar(const immer::vector<T>&, const immer::vector<T>&)
{
    return true;
}

template <typename T>
bool values_similar(const immer::map<std::string, T>&, const immer::map<std::string, T>&)
{
    return true;
}

template <typename T>
bool values_similar(const immer::box<T>& a, const immer::box<T>& b)
{
    return values_similar(a.get(), b.get());
}

// ============================================================
// Diff rules (definitions)
// ============================================================

template <typename T>
void diff_value(const T& previous, const T& current, const Path& path, PatchCollector& out)
{
    if (previous == current) {
        return;
    }
    if constexpr (StructurallyDiffable<T>) {
        if (previous.is_similar(current)) {
            current.difference_from(previous, path, out);
            return;
        }
    }
    out.replace(path, to_value(current));
}

template <typename T>
void diff_value(const std::optional<T>& previous, const std::optional<T>& current,
                const Path& path, PatchCollector& out)
{
    if (!previous && !current) {
        return;
    }
    if (!current) {
        out.remove(path);
        return;
    }
    if (!previous) {
        out.add(path, to_value(*current));
        return;
    }
    diff_value(*previous, *current, path, out);
}

/// Emits removals (descending original index), then insertions (ascending
/// final index), then the diffs of matched pairs addressed by final index.
template <typename T>
void diff_value(const immer::vector<T>& previous, const immer::vector<T>& current,
                const Path& path, PatchCollector& out)
{
    if (previous == current) {
        return;
    }

    auto script = align(previous, current,
                        [](const T& a, const T& b) { return values_similar(a, b); },
                        out.options().max_alignment_cells);

    if (script.exceeded_limit) {
        out.report(DiffErrorCode::AlignmentLimitExceeded, {}, path,
                   "aligning " + std::to_string(previous.size()) + " x " +
                   std::to_string(current.size()) + " elements exceeds the cell limit; replacing the sequence");
        out.replace(path, to_value(current));
        return;
    }

    for (auto it = script.removals.rbegin(); it != script.removals.rend(); ++it) {
        out.remove(append_path(path, *it));
    }
    for (auto j : script.insertions) {
        out.add(append_path(path, j), to_value(current[j]));
    }
    for (const auto& [i, j] : script.matches) {
        diff_value(previous[i], current[j], append_path(path, j), out);
    }
}

/// Keys are visited in sorted order; a missing key is an Add or a Remove
template <typename T>
void diff_value(const immer::map<std::string, T>& previous, const immer::map<std::string, T>& current,
                const Path& path, PatchCollector& out)
{
    if (previous == current) {
        return;
    }

    struct KeyChange {
        const T* previous = nullptr;
        const T* current = nullptr;
    };
    std::map<std::string, KeyChange> changes;

    immer::diff(previous, current, immer::make_differ(
        // added
        [&](const auto& added_kv) {
            changes[added_kv.first].current = &added_kv.second;
        },
        // removed
        [&](const auto& removed_kv) {
            changes[removed_kv.first].previous = &removed_kv.second;
        },
        // changed (retained key)
        [&](const auto& old_kv, const auto& new_kv) {
            auto& change = changes[old_kv.first];
            change.previous = &old_kv.second;
            change.current = &new_kv.second;
        }));

    for (const auto& [key, change] : changes) {
        auto key_path = append_path(path, key);
        if (!change.previous) {
            out.add(key_path, to_value(*change.current));
        } else if (!change.current) {
            out.remove(key_path);
        } else {
            diff_value(*change.previous, *change.current, key_path, out);
        }
    }
}

template <typename T>
void diff_value(const immer::box<T>& previous, const immer::box<T>& current,
                const Path& path, PatchCollector& out)
{
    diff_value(previous.get(), current.get(), path, out);
}

// ============================================================
// DifferenceBuilder
// ============================================================

/// Field-wise diff of one composite value.
///
/// Each add_difference applies the diff rules to one field at
/// `path + [key]`. Fields may be named by member pointer or computed by
/// an accessor.
template <typename T>
class DifferenceBuilder {
public:
    DifferenceBuilder(const T& previous, const T& current, const Path& path, PatchCollector& out)
        : previous_(previous)
        , current_(current)
        , path_(path)
        , out_(out)
    {}

    template <typename Field>
    DifferenceBuilder& add_difference(Field T::*member, std::string_view key) {
        diff_value(previous_.*member, current_.*member, append_path(path_, std::string{key}), out_);
        return *this;
    }

    template <typename Accessor>
    requires std::invocable<const Accessor&, const T&>
    DifferenceBuilder& add_difference(std::string_view key, const Accessor& accessor) {
        const auto previous_field = accessor(previous_);
        const auto current_field = accessor(current_);
        diff_value(previous_field, current_field, append_path(path_, std::string{key}), out_);
        return *this;
    }

private:
    const T& previous_;
    const T& current_;
    const Path& path_;
    PatchCollector& out_;
};

// ============================================================
// Entry point
// ============================================================

/// Diff two snapshots of a composite model.
///
/// Equal roots give an empty patch; dissimilar roots give one Replace of
/// the whole document; otherwise the fields are diffed from the root.
/// With UnhandledKindPolicy::ReplaceRoot any unhandled kind degrades the
/// patch to a single root Replace.
template <StructurallyDiffable T>
[[nodiscard]] DiffResult diff(const T& previous, const T& current, const DiffOptions& options = {})
{
    PatchCollector out{options};
    if (previous == current) {
        return std::move(out).finish();
    }
    if (!previous.is_similar(current)) {
        out.replace_root(to_value(current));
        return std::move(out).finish();
    }

    current.difference_from(previous, Path{}, out);

    if (options.unhandled_kind_policy == UnhandledKindPolicy::ReplaceRoot &&
        out.has_diagnostic(DiffErrorCode::UnhandledKind)) {
        out.replace_root(to_value(current));
    }
    return std::move(out).finish();
}

} // namespace render_diff
