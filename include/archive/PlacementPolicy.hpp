#pragma once

#include "model/Media.hpp"
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace photodb::archive {

/**
 * PlacementPolicy: where a file belongs in the archive, and the
 * collision-safe filesystem operations that put it there.
 *
 * Layout: <archive_root>/<year>/<date>[ - <location>]/<filename>
 *
 * Free names are chosen under an in-process lock and held in a reservation
 * set until the copy/move completes, so two workers never pick the same
 * target. External writers are not guarded against.
 */
class PlacementPolicy {
public:
    PlacementPolicy(std::filesystem::path archive_root, std::filesystem::path duplicates_dir);

    [[nodiscard]] std::filesystem::path destination_for(const model::MediaRecord& record,
                                                        const std::string& filename) const;

    // First free variant of `desired` (name, name_001, name_002, ...), held until released
    [[nodiscard]] std::optional<std::filesystem::path> reserve(const std::filesystem::path& desired);
    void release(const std::filesystem::path& reserved);

    // Copy into a reserved slot; the reservation is released either way
    std::optional<std::filesystem::path> copy_to(const std::filesystem::path& source,
                                                 const std::filesystem::path& reserved);

    // Move to the first free variant of `desired`; rename, else copy+remove across devices
    std::optional<std::filesystem::path> move_to(const std::filesystem::path& source,
                                                 const std::filesystem::path& desired);

    // Move into <duplicates_dir>/<source relative to scan_root>
    std::optional<std::filesystem::path> relocate_duplicate(const std::filesystem::path& source,
                                                            const std::filesystem::path& scan_root);

    // "/" -> "-" so a location never adds directory levels
    [[nodiscard]] static std::string sanitize(const std::string& component);

    // name.ext -> name_NNN.ext
    [[nodiscard]] static std::filesystem::path with_suffix(const std::filesystem::path& path, int n);

    [[nodiscard]] const std::filesystem::path& archive_root() const { return archive_root_; }
    [[nodiscard]] const std::filesystem::path& duplicates_dir() const { return duplicates_dir_; }

    static constexpr int MAX_SUFFIX = 999999;

private:
    bool transfer(const std::filesystem::path& source, const std::filesystem::path& target, bool keep_source);

    std::filesystem::path archive_root_;
    std::filesystem::path duplicates_dir_;

    std::mutex mutex_;
    std::set<std::filesystem::path> reserved_;
};

}  // namespace photodb::archive
