#include "archive/SyncStats.hpp"
#include <format>

namespace photodb::archive {

SyncStats::SyncStats(const SyncStats& other) {
    *this = other;
}

SyncStats& SyncStats::operator=(const SyncStats& other) {
    directories_visited = other.directories_visited.load();
    directories_skipped = other.directories_skipped.load();
    files_new = other.files_new.load();
    files_stale = other.files_stale.load();
    files_archived = other.files_archived.load();
    files_duplicate = other.files_duplicate.load();
    files_skipped = other.files_skipped.load();
    files_failed = other.files_failed.load();
    files_copied = other.files_copied.load();
    files_moved = other.files_moved.load();
    return *this;
}

void SyncStats::record(const FileReport& report) {
    switch (report.status) {
        case FileStatus::New: ++files_new; break;
        case FileStatus::StaleReplaced: ++files_stale; break;
        case FileStatus::AlreadyArchived: ++files_archived; break;
        case FileStatus::Duplicate: ++files_duplicate; break;
        case FileStatus::Skipped: ++files_skipped; break;
        case FileStatus::Failed: ++files_failed; break;
    }
    if (report.copied) ++files_copied;
    if (report.moved) ++files_moved;
}

size_t SyncStats::files_processed() const {
    return files_new + files_stale + files_archived + files_duplicate + files_skipped + files_failed;
}

std::string SyncStats::summary() const {
    return std::format("{} dirs ({} unchanged), {} files: {} new, {} stale, {} archived, "
                       "{} duplicate, {} skipped, {} failed; {} copied, {} moved",
                       directories_visited.load(), directories_skipped.load(), files_processed(),
                       files_new.load(), files_stale.load(), files_archived.load(),
                       files_duplicate.load(), files_skipped.load(), files_failed.load(),
                       files_copied.load(), files_moved.load());
}

}  // namespace photodb::archive
