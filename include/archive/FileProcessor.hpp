#pragma once

#include "archive/RunContext.hpp"
#include "archive/DedupEngine.hpp"
#include "archive/SyncStats.hpp"
#include <filesystem>

namespace photodb::archive {

/**
 * FileProcessor: the per-file pipeline run on a worker thread.
 *
 *   skip list -> HEIC handling -> metadata -> fingerprint -> dedup -> placement
 *
 * process() never throws; every failure is logged and reported as Failed.
 */
class FileProcessor {
public:
    explicit FileProcessor(RunContext& ctx);

    // scan_root anchors duplicate relocation (<duplicates>/<path under scan_root>)
    FileReport process(const std::filesystem::path& file, const std::filesystem::path& scan_root);

private:
    FileReport process_heic(const std::filesystem::path& file, const std::filesystem::path& scan_root);

    // metadata_source differs from file only for transcoded HEIC images
    FileReport process_media(const std::filesystem::path& file,
                             const std::filesystem::path& metadata_source,
                             const std::filesystem::path& scan_root);

    RunContext& ctx_;
    DedupEngine dedup_;
};

}  // namespace photodb::archive
