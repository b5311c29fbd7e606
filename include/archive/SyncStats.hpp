#pragma once

#include <atomic>
#include <cstddef>
#include <string>

namespace photodb::archive {

enum class FileStatus {
    New,
    StaleReplaced,
    AlreadyArchived,
    Duplicate,
    Skipped,
    Failed,
};

struct FileReport {
    FileStatus status = FileStatus::Skipped;
    bool copied = false;
    bool moved = false;
};

// Counters updated concurrently by workers; copies take a snapshot
struct SyncStats {
    std::atomic<size_t> directories_visited{0};
    std::atomic<size_t> directories_skipped{0};
    std::atomic<size_t> files_new{0};
    std::atomic<size_t> files_stale{0};
    std::atomic<size_t> files_archived{0};
    std::atomic<size_t> files_duplicate{0};
    std::atomic<size_t> files_skipped{0};
    std::atomic<size_t> files_failed{0};
    std::atomic<size_t> files_copied{0};
    std::atomic<size_t> files_moved{0};

    SyncStats() = default;
    SyncStats(const SyncStats& other);
    SyncStats& operator=(const SyncStats& other);

    void record(const FileReport& report);

    [[nodiscard]] size_t files_processed() const;
    [[nodiscard]] size_t placements() const { return files_copied + files_moved; }
    [[nodiscard]] std::string summary() const;
};

}  // namespace photodb::archive
