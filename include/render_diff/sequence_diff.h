// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sequence_diff.h
/// @brief Similarity-driven alignment of two ordered sequences.
///
/// The alignment is a longest common subsequence where two elements
/// "match" when they are similar (not necessarily equal). Matched pairs
/// are later diffed in place; unmatched elements become removals and
/// insertions.
///
/// Usage:
/// @code
///   auto script = align(previous, current,
///                       [](const auto& a, const auto& b) { return a.id == b.id; },
///                       options.max_alignment_cells);
///   if (!script.exceeded_limit) {
///       for (auto i : script.removals) { ... }
///   }
/// @endcode

#pragma once

#include <render_diff/api.h>
#include <render_diff/concepts.h>

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace render_diff {

struct EditScript {
    std::vector<std::size_t> removals;                          // Original indices, ascending
    std::vector<std::size_t> insertions;                        // Final indices, ascending
    std::vector<std::pair<std::size_t, std::size_t>> matches;   // (original, final), ascending

    /// Set when the alignment table would exceed the cell limit; nothing else is filled
    bool exceeded_limit = false;

    [[nodiscard]] bool is_identity() const noexcept {
        return !exceeded_limit && removals.empty() && insertions.empty();
    }
};

using SimilarityPredicate = std::function<bool(std::size_t previous_index, std::size_t current_index)>;

/// Align two sequences of the given sizes.
///
/// The common prefix and suffix of pairwise similar elements are matched
/// first. The remaining middle is aligned with an LCS table; among
/// alignments of equal length the earliest pairs are matched first, so
/// duplicate similar elements keep their original relative order.
///
/// @param max_cells Upper bound on rows * columns of the LCS table
[[nodiscard]] RENDER_DIFF_API EditScript align_sequences(std::size_t previous_size,
                                                         std::size_t current_size,
                                                         const SimilarityPredicate& similar,
                                                         std::size_t max_cells);

template <SequenceLike Seq, typename Similar>
[[nodiscard]] EditScript align(const Seq& previous, const Seq& current, Similar&& similar,
                               std::size_t max_cells)
{
    return align_sequences(
        previous.size(), current.size(),
        [&](std::size_t i, std::size_t j) { return similar(previous[i], current[j]); },
        max_cells);
}

} // namespace render_diff
