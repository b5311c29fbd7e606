#pragma once

#include "store/KeyValueStore.hpp"
#include "model/Media.hpp"
#include "util/FileHasher.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <cstdint>

namespace photodb::store {

/**
 * Typed view over the fingerprint table.
 *
 * Holds FingerprintRecords keyed by fingerprint and DirectoryWatermarks keyed
 * by absolute directory path. Canonical paths under the archive root are
 * stored relative to it so the archive can be remounted elsewhere.
 */
class FingerprintStore {
public:
    // Throws StoreError if the table cannot be opened
    FingerprintStore(const std::filesystem::path& db_path, const std::filesystem::path& archive_root);

    [[nodiscard]] std::optional<model::FingerprintRecord> lookup(const util::Fingerprint& fp);

    // Conditional insert: false if a record already exists (or on error)
    [[nodiscard]] bool claim(const util::Fingerprint& fp, const model::FingerprintRecord& record);

    // Unconditional write
    bool replace(const util::Fingerprint& fp, const model::FingerprintRecord& record);

    bool forget(const util::Fingerprint& fp);

    [[nodiscard]] std::optional<int64_t> watermark(const std::string& directory);
    bool commit_watermark(const std::string& directory, int64_t mtime_ns);
    bool clear_watermark(const std::string& directory);

    // Stored form of a path: relative to the archive root when inside it
    [[nodiscard]] std::string to_stored_path(const std::filesystem::path& path) const;

    // Absolute form of a stored canonical path
    [[nodiscard]] std::filesystem::path resolve_path(const model::FingerprintRecord& record) const;

    [[nodiscard]] const std::filesystem::path& archive_root() const { return archive_root_; }

    void close() { kv_.close(); }

private:
    KeyValueStore kv_;
    std::filesystem::path archive_root_;
};

}  // namespace photodb::store
