// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <render_diff/archive_diff.h>
#include <render_diff/encode.h>

#include <immer/map_transient.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace render_diff {

Value to_value(const VersionPatch& version_patch)
{
    return ObjectEncoder{}
        .field("version", version_patch.version)
        .field("patch", patch_to_value(version_patch.patch))
        .finish();
}

VersionPatch index_version_patch(const RenderIndex& previous, const RenderIndex& current,
                                 const DiffOptions& options)
{
    auto version = previous.metadata ? previous.metadata->version : ArchiveVersion{"N/A", "N/A"};
    return VersionPatch{std::move(version), diff_render_indexes(previous, current, options).patch};
}

// ============================================================
// Change classification
// ============================================================

namespace {

bool is_deprecated_on(const RenderNode& node, const std::string& platform_name)
{
    const auto& platforms = node.metadata.platforms;
    if (!platforms) {
        return false;
    }
    return std::any_of(platforms->begin(), platforms->end(), [&](const PlatformAvailability& p) {
        return p.name == platform_name && p.deprecated;
    });
}

} // anonymous namespace

std::optional<RenderIndexChange> classify_change(const RenderNode* previous, const RenderNode& current,
                                                 const DiffResult& result)
{
    if (!previous) {
        return RenderIndexChange::Added;
    }
    if (!result.has_changes()) {
        return std::nullopt;
    }
    if (const auto& platforms = current.metadata.platforms) {
        for (const auto& platform : *platforms) {
            if (platform.deprecated && !is_deprecated_on(*previous, platform.name)) {
                return RenderIndexChange::Deprecated;
            }
        }
    }
    return RenderIndexChange::Modified;
}

// ============================================================
// DifferencesCache
// ============================================================

void DifferencesCache::record(const std::string& page, const std::string& version_id, RenderIndexChange change)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    changes_[page][version_id] = change;
}

std::optional<RenderIndexChange> DifferencesCache::lookup(const std::string& page,
                                                          const std::string& version_id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto page_it = changes_.find(page);
    if (page_it == changes_.end()) {
        return std::nullopt;
    }
    auto version_it = page_it->second.find(version_id);
    if (version_it == page_it->second.end()) {
        return std::nullopt;
    }
    return version_it->second;
}

DifferencesCache::Snapshot DifferencesCache::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return changes_;
}

std::size_t DifferencesCache::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return changes_.size();
}

VersionDifferences DifferencesCache::version_differences() const
{
    auto pages = VersionDifferences{}.transient();
    for (const auto& [page, versions] : snapshot()) {
        auto entry = immer::map<std::string, RenderIndexChange>{}.transient();
        for (const auto& [version_id, change] : versions) {
            entry.set(version_id, change);
        }
        pages.set(page, entry.persistent());
    }
    return pages.persistent();
}

Value DifferencesCache::to_value() const
{
    return render_diff::to_value(version_differences());
}

// ============================================================
// ArchiveDiffer
// ============================================================

ArchiveDiffer::ArchiveDiffer(ArchiveVersion previous_version, DiffOptions options)
    : previous_version_(std::move(previous_version))
    , options_(options)
{}

PageDiff ArchiveDiffer::diff_page(const std::optional<RenderNode>& previous, const RenderNode& current)
{
    PageDiff page_diff;
    page_diff.page = current.identifier.path;

    if (previous) {
        page_diff.result = diff_render_nodes(*previous, current, options_);
    } else {
        // A new page: the whole document is the addition
        page_diff.result.patch.push_back(PatchOperation::add(Path{}, to_value(current)));
    }

    page_diff.change = classify_change(previous ? &*previous : nullptr, current, page_diff.result);
    if (page_diff.change) {
        cache_.record(page_diff.page, previous_version_.identifier, *page_diff.change);
    }
    return page_diff;
}

namespace {

/// Owns the diff workers and joins every started thread, also during unwinding
class WorkerThreads {
public:
    explicit WorkerThreads(std::size_t count) { threads_.reserve(count); }
    ~WorkerThreads() { join(); }

    WorkerThreads(const WorkerThreads&) = delete;
    WorkerThreads& operator=(const WorkerThreads&) = delete;

    template <typename Fn>
    void start(Fn& fn) { threads_.emplace_back(fn); }

    void join()
    {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

private:
    std::vector<std::thread> threads_;
};

} // namespace

std::vector<PageDiff> ArchiveDiffer::diff_pages(const std::vector<PageVersions>& pages, std::size_t worker_count)
{
    std::vector<PageDiff> results(pages.size());
    const std::size_t workers = std::clamp<std::size_t>(worker_count, 1, std::max<std::size_t>(pages.size(), 1));

    if (workers == 1) {
        for (std::size_t i = 0; i < pages.size(); ++i) {
            results[i] = diff_page(pages[i].previous, pages[i].current);
        }
        return results;
    }

    std::atomic<std::size_t> cursor{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto run = [&]() {
        try {
            for (std::size_t i = cursor.fetch_add(1); i < pages.size(); i = cursor.fetch_add(1)) {
                results[i] = diff_page(pages[i].previous, pages[i].current);
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(failure_mutex);
            if (!failure) {
                failure = std::current_exception();
            }
            cursor.store(pages.size());
        }
    };

    WorkerThreads threads{workers};
    try {
        for (std::size_t w = 0; w < workers; ++w) {
            threads.start(run);
        }
    } catch (...) {
        // Stop the workers already running; the destructor joins them
        cursor.store(pages.size());
        throw;
    }
    threads.join();

    if (failure) {
        std::rethrow_exception(failure);
    }
    return results;
}

VersionPatch ArchiveDiffer::version_patch(const PageDiff& page_diff) const
{
    return VersionPatch{previous_version_, page_diff.result.patch};
}

} // namespace render_diff
