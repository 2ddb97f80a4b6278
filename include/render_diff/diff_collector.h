// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_collector.h
/// @brief Output sink of a diff: the patch being built, its diagnostics and the options.
///
/// Diagnostics never abort a diff. They travel back to the caller in
/// DiffResult next to the (possibly degraded) patch.

#pragma once

#include <render_diff/api.h>
#include <render_diff/patch.h>
#include <render_diff/value.h>

#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace render_diff {

enum class DiffErrorCode {
    UnhandledKind,           // Variant pairing with no kind-specific handler
    AlignmentLimitExceeded,  // Sequence too large to align; replaced whole
};

[[nodiscard]] RENDER_DIFF_API std::string_view diff_error_code_name(DiffErrorCode code);

/// What to do with a page once an unhandled kind pairing is found
enum class UnhandledKindPolicy {
    ReplaceSubtree,  // Replace only the offending subtree
    ReplaceRoot,     // Degrade the whole patch to a single root replace
};

struct DiffOptions {
    UnhandledKindPolicy unhandled_kind_policy = UnhandledKindPolicy::ReplaceSubtree;

    /// Upper bound on previous.size() * current.size() for one sequence alignment
    std::size_t max_alignment_cells = 4'000'000;
};

struct DiffDiagnostic {
    DiffErrorCode code = DiffErrorCode::UnhandledKind;
    std::string kind;       // Offending kind tag(s), empty when not kind related
    std::string pointer;    // Where it happened
    std::string message;
};

struct DiffResult {
    Patch patch;
    std::vector<DiffDiagnostic> diagnostics;

    [[nodiscard]] bool has_changes() const noexcept { return !patch.empty(); }
    [[nodiscard]] bool has_diagnostics() const noexcept { return !diagnostics.empty(); }
};

class RENDER_DIFF_API PatchCollector {
public:
    explicit PatchCollector(DiffOptions options = {});

    void add(const Path& path, Value value);
    void remove(const Path& path);
    void replace(const Path& path, Value value);

    /// Discard everything collected so far and replace the whole document
    void replace_root(Value value);

    void report(DiffErrorCode code, std::string kind, const Path& path, std::string message,
                std::source_location loc = std::source_location::current());

    /// Record a pairing of kinds that no handler covers
    void report_unhandled_kind(std::string_view previous_kind, std::string_view current_kind, const Path& path,
                               std::source_location loc = std::source_location::current());

    [[nodiscard]] const DiffOptions& options() const noexcept { return options_; }
    [[nodiscard]] const Patch& patch() const noexcept { return patch_; }
    [[nodiscard]] const std::vector<DiffDiagnostic>& diagnostics() const noexcept { return diagnostics_; }
    [[nodiscard]] bool has_diagnostic(DiffErrorCode code) const;

    /// Move the collected patch and diagnostics out
    [[nodiscard]] DiffResult finish() &&;

private:
    DiffOptions options_;
    Patch patch_;
    std::vector<DiffDiagnostic> diagnostics_;
};

} // namespace render_diff
