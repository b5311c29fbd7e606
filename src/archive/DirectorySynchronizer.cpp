#include "archive/DirectorySynchronizer.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <format>

namespace fs = std::filesystem;

namespace photodb::archive {

DirectorySynchronizer::DirectorySynchronizer(RunContext& ctx, FileProcessor& processor, util::WorkerPool& pool)
    : ctx_(ctx),
      processor_(processor),
      pool_(pool) {}

bool DirectorySynchronizer::is_excluded(const fs::path& dir) const {
    const std::string normalized = util::DirectoryScanner::normalize(dir);
    return std::any_of(ctx_.options.excluded_dirs.begin(), ctx_.options.excluded_dirs.end(),
                       [&](const fs::path& excluded) {
                           return util::DirectoryScanner::normalize(excluded) == normalized;
                       });
}

SyncStats DirectorySynchronizer::run(const fs::path& root) {
    SyncStats stats;
    auto start = std::chrono::steady_clock::now();

    const fs::path normalized_root = util::DirectoryScanner::normalize(root);
    util::Logger::info("Synchronizing " + normalized_root.string() +
                       (ctx_.options.import_mode ? " (import)" : "") +
                       (ctx_.options.force ? " (forced)" : ""));

    sync_directory(normalized_root, normalized_root, stats);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    util::Logger::info(std::format("Synchronized {} in {}ms: {}", normalized_root.string(), elapsed.count(),
                                   stats.summary()));
    return stats;
}

void DirectorySynchronizer::sync_directory(const fs::path& dir, const fs::path& root, SyncStats& stats) {
    util::Logger::debug("Processing directory " + dir.string());

    auto listing = util::DirectoryScanner::list_directory(dir);
    if (!listing) {
        util::Logger::error("DirectorySynchronizer: cannot list " + dir.string() + ", leaving it for the next run (op=list)");
        return;
    }
    ++stats.directories_visited;

    for (const auto& sub : listing->subdirectories) {
        if (is_excluded(sub)) {
            util::Logger::debug("DirectorySynchronizer: not entering excluded " + sub);
            continue;
        }
        sync_directory(sub, root, stats);
    }

    const std::string key = util::DirectoryScanner::normalize(dir);
    if (!ctx_.options.force) {
        auto watermark = ctx_.store.watermark(key);
        if (watermark && listing->mtime_ns <= *watermark) {
            util::Logger::debug("DirectorySynchronizer: " + key + " unchanged since last run");
            ++stats.directories_skipped;
            return;
        }
    }

    bool all_dispatched = true;
    for (const auto& file : listing->files) {
        fs::path path(file);
        bool queued = pool_.submit([this, path, &root, &stats]() {
            stats.record(processor_.process(path, root));
        });
        if (!queued) {
            util::Logger::error("DirectorySynchronizer: worker pool refused " + file + " (op=dispatch)");
            all_dispatched = false;
        }
    }

    pool_.wait_idle();

    if (!all_dispatched) {
        util::Logger::warn("DirectorySynchronizer: " + key + " incomplete, watermark not updated");
        return;
    }

    if (!ctx_.store.commit_watermark(key, listing->mtime_ns)) {
        return;
    }
    util::Logger::debug("Completed processing directory " + key);
}

}  // namespace photodb::archive
