// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/diff_collector.h>

#include <algorithm>
#include <iostream>

namespace render_diff {

namespace {

void log_diagnostic(const DiffDiagnostic& diagnostic, std::source_location loc) noexcept
{
#if RENDER_DIFF_VERBOSE_LOG
    std::cerr << "[diff] " << diff_error_code_name(diagnostic.code)
              << " at \"" << diagnostic.pointer << "\": " << diagnostic.message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)diagnostic;
    (void)loc;
#endif
}

} // anonymous namespace

std::string_view diff_error_code_name(DiffErrorCode code)
{
    switch (code) {
        case DiffErrorCode::UnhandledKind:          return "UnhandledKind";
        case DiffErrorCode::AlignmentLimitExceeded: return "AlignmentLimitExceeded";
    }
    return "Unknown";
}

PatchCollector::PatchCollector(DiffOptions options)
    : options_(options)
{
    patch_.reserve(16);
}

void PatchCollector::add(const Path& path, Value value)
{
    patch_.push_back(PatchOperation::add(path, std::move(value)));
}

void PatchCollector::remove(const Path& path)
{
    patch_.push_back(PatchOperation::remove(path));
}

void PatchCollector::replace(const Path& path, Value value)
{
    patch_.push_back(PatchOperation::replace(path, std::move(value)));
}

void PatchCollector::replace_root(Value value)
{
    patch_.clear();
    patch_.push_back(PatchOperation::replace(Path{}, std::move(value)));
}

void PatchCollector::report(DiffErrorCode code, std::string kind, const Path& path, std::string message,
                            std::source_location loc)
{
    DiffDiagnostic diagnostic{code, std::move(kind), path_to_json_pointer(path), std::move(message)};
    log_diagnostic(diagnostic, loc);
    diagnostics_.push_back(std::move(diagnostic));
}

void PatchCollector::report_unhandled_kind(std::string_view previous_kind, std::string_view current_kind,
                                           const Path& path, std::source_location loc)
{
    std::string kind{current_kind};
    std::string message = "no handler for kind \"" + kind + "\"";
    if (previous_kind != current_kind) {
        kind = std::string{previous_kind} + "->" + kind;
        message = "no handler pairs kind \"" + std::string{previous_kind} +
                  "\" with kind \"" + std::string{current_kind} + "\"";
    }
    report(DiffErrorCode::UnhandledKind, std::move(kind), path, std::move(message), loc);
}

bool PatchCollector::has_diagnostic(DiffErrorCode code) const
{
    return std::any_of(diagnostics_.begin(), diagnostics_.end(),
                       [code](const DiffDiagnostic& d) { return d.code == code; });
}

DiffResult PatchCollector::finish() &&
{
    return DiffResult{std::move(patch_), std::move(diagnostics_)};
}

} // namespace render_diff
