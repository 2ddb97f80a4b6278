// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file archive_diff.h
/// @brief Diffing a whole documentation archive against its previous version.
///
/// Each page is diffed independently. Pages may be diffed on several
/// worker threads; the only shared mutable state is the DifferencesCache,
/// which records how each page changed in each version.
///
/// Usage:
/// @code
///   ArchiveDiffer differ{ArchiveVersion{"v2", "Version 2"}};
///   auto results = differ.diff_pages(pages, 4);
///   for (const auto& page : results) {
///       if (page.change) {
///           VersionPatch patch = differ.version_patch(page);
///           ...
///       }
///   }
///   std::cout << to_json(differ.cache().to_value()) << "\n";
/// @endcode

#pragma once

#include <render_diff/api.h>
#include <render_diff/diff_collector.h>
#include <render_diff/patch.h>
#include <render_diff/render_index.h>
#include <render_diff/render_metadata.h>
#include <render_diff/render_node.h>

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace render_diff {

/// Patch that turns a page's previous version into the given version
struct VersionPatch {
    ArchiveVersion version;
    Patch patch;
};

/// {"version": {...}, "patch": [...]}
[[nodiscard]] RENDER_DIFF_API Value to_value(const VersionPatch& version_patch);

/// Diff two navigation indexes, labelled with the previous index's version
/// ("N/A" when it carries no metadata)
[[nodiscard]] RENDER_DIFF_API VersionPatch index_version_patch(const RenderIndex& previous,
                                                               const RenderIndex& current,
                                                               const DiffOptions& options = {});

/// Classify one page's change.
/// @param previous The page in the previous version, or nullptr if it is new
/// @return std::nullopt when the page did not change
[[nodiscard]] RENDER_DIFF_API std::optional<RenderIndexChange> classify_change(const RenderNode* previous,
                                                                               const RenderNode& current,
                                                                               const DiffResult& result);

/// page path -> (version identifier -> change), safe for concurrent use
class RENDER_DIFF_API DifferencesCache {
public:
    using VersionChanges = std::map<std::string, RenderIndexChange>;
    using Snapshot = std::map<std::string, VersionChanges>;

    void record(const std::string& page, const std::string& version_id, RenderIndexChange change);

    [[nodiscard]] std::optional<RenderIndexChange> lookup(const std::string& page,
                                                          const std::string& version_id) const;

    [[nodiscard]] Snapshot snapshot() const;
    [[nodiscard]] std::size_t size() const;

    /// The recorded changes in the navigation index's versionDifferences shape
    [[nodiscard]] VersionDifferences version_differences() const;

    /// Pages and versions in sorted order
    [[nodiscard]] Value to_value() const;

private:
    mutable std::shared_mutex mutex_;
    Snapshot changes_;
};

/// Result of diffing one page
struct PageDiff {
    std::string page;                       // Page path, e.g. "/documentation/kit/widget"
    std::optional<RenderIndexChange> change;
    DiffResult result;
};

/// Both versions of one page; previous is empty for a new page
struct PageVersions {
    std::optional<RenderNode> previous;
    RenderNode current;
};

class RENDER_DIFF_API ArchiveDiffer {
public:
    explicit ArchiveDiffer(ArchiveVersion previous_version, DiffOptions options = {});

    ArchiveDiffer(const ArchiveDiffer&) = delete;
    ArchiveDiffer& operator=(const ArchiveDiffer&) = delete;

    /// Diff one page and record its change in the cache
    [[nodiscard]] PageDiff diff_page(const std::optional<RenderNode>& previous, const RenderNode& current);

    /// Diff all pages on up to @p worker_count threads; results are in input order
    [[nodiscard]] std::vector<PageDiff> diff_pages(const std::vector<PageVersions>& pages,
                                                   std::size_t worker_count = 1);

    [[nodiscard]] VersionPatch version_patch(const PageDiff& page_diff) const;

    [[nodiscard]] const ArchiveVersion& previous_version() const noexcept { return previous_version_; }
    [[nodiscard]] const DiffOptions& options() const noexcept { return options_; }
    [[nodiscard]] const DifferencesCache& cache() const noexcept { return cache_; }

private:
    ArchiveVersion previous_version_;
    DiffOptions options_;
    DifferencesCache cache_;
};

} // namespace render_diff
