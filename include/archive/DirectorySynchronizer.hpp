#pragma once

#include "archive/RunContext.hpp"
#include "archive/FileProcessor.hpp"
#include "archive/SyncStats.hpp"
#include "util/WorkerPool.hpp"
#include <filesystem>
#include <string>

namespace photodb::archive {

/**
 * DirectorySynchronizer: incremental walk of one tree.
 *
 * For each directory: list it, recurse into every subdirectory first, then
 * compare the directory's mtime with its stored watermark. Unchanged
 * directories dispatch nothing. Otherwise all of its files go to the worker
 * pool, the walk blocks until that batch is done, and only then is the mtime
 * observed at listing time committed as the new watermark.
 */
class DirectorySynchronizer {
public:
    DirectorySynchronizer(RunContext& ctx, FileProcessor& processor, util::WorkerPool& pool);

    SyncStats run(const std::filesystem::path& root);

private:
    void sync_directory(const std::filesystem::path& dir, const std::filesystem::path& root, SyncStats& stats);
    bool is_excluded(const std::filesystem::path& dir) const;

    RunContext& ctx_;
    FileProcessor& processor_;
    util::WorkerPool& pool_;
};

}  // namespace photodb::archive
