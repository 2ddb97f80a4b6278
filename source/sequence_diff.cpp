// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/sequence_diff.h>

#include <algorithm>
#include <cstdint>

namespace render_diff {

namespace {

/// LCS table over the unmatched middle, stored row-major with one extra
/// row and column of zeros. dp(i, j) is the LCS length of the suffixes
/// starting at i and j.
class LcsTable {
public:
    LcsTable(std::size_t rows, std::size_t cols)
        : cols_(cols + 1)
        , lengths_((rows + 1) * (cols + 1), 0)
        , similar_(rows * cols, false)
        , sim_cols_(cols)
    {}

    std::uint32_t& length(std::size_t i, std::size_t j) { return lengths_[i * cols_ + j]; }
    std::uint32_t length(std::size_t i, std::size_t j) const { return lengths_[i * cols_ + j]; }

    void mark_similar(std::size_t i, std::size_t j) { similar_[i * sim_cols_ + j] = true; }
    bool similar(std::size_t i, std::size_t j) const { return similar_[i * sim_cols_ + j]; }

private:
    std::size_t cols_;
    std::vector<std::uint32_t> lengths_;
    std::vector<bool> similar_;
    std::size_t sim_cols_;
};

} // anonymous namespace

EditScript align_sequences(std::size_t previous_size, std::size_t current_size,
                           const SimilarityPredicate& similar, std::size_t max_cells)
{
    EditScript script;

    // Common prefix
    std::size_t prefix = 0;
    while (prefix < previous_size && prefix < current_size && similar(prefix, prefix)) {
        ++prefix;
    }

    // Common suffix, not overlapping the prefix
    std::size_t suffix = 0;
    while (suffix < previous_size - prefix && suffix < current_size - prefix &&
           similar(previous_size - 1 - suffix, current_size - 1 - suffix)) {
        ++suffix;
    }

    const std::size_t rows = previous_size - prefix - suffix;
    const std::size_t cols = current_size - prefix - suffix;

    if (rows != 0 && cols != 0 && cols > max_cells / rows) {
        script.exceeded_limit = true;
        return script;
    }

    for (std::size_t k = 0; k < prefix; ++k) {
        script.matches.emplace_back(k, k);
    }

    if (rows == 0 || cols == 0) {
        for (std::size_t i = 0; i < rows; ++i) {
            script.removals.push_back(prefix + i);
        }
        for (std::size_t j = 0; j < cols; ++j) {
            script.insertions.push_back(prefix + j);
        }
    } else {
        LcsTable table(rows, cols);
        for (std::size_t i = rows; i-- > 0;) {
            for (std::size_t j = cols; j-- > 0;) {
                if (similar(prefix + i, prefix + j)) {
                    table.mark_similar(i, j);
                    table.length(i, j) = table.length(i + 1, j + 1) + 1;
                } else {
                    table.length(i, j) = std::max(table.length(i + 1, j), table.length(i, j + 1));
                }
            }
        }

        std::size_t i = 0;
        std::size_t j = 0;
        while (i < rows && j < cols) {
            if (table.similar(i, j) && table.length(i, j) == table.length(i + 1, j + 1) + 1) {
                script.matches.emplace_back(prefix + i, prefix + j);
                ++i;
                ++j;
            } else if (table.length(i + 1, j) >= table.length(i, j + 1)) {
                script.removals.push_back(prefix + i);
                ++i;
            } else {
                script.insertions.push_back(prefix + j);
                ++j;
            }
        }
        for (; i < rows; ++i) {
            script.removals.push_back(prefix + i);
        }
        for (; j < cols; ++j) {
            script.insertions.push_back(prefix + j);
        }
    }

    for (std::size_t k = suffix; k-- > 0;) {
        script.matches.emplace_back(previous_size - 1 - k, current_size - 1 - k);
    }

    return script;
}

} // namespace render_diff
