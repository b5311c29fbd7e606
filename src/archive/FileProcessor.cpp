#include "archive/FileProcessor.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <exception>
#include <system_error>

namespace fs = std::filesystem;

namespace photodb::archive {

FileProcessor::FileProcessor(RunContext& ctx)
    : ctx_(ctx),
      dedup_(ctx.store) {}

FileReport FileProcessor::process(const fs::path& file, const fs::path& scan_root) {
    try {
        util::Logger::debug("Processing file " + file.string());

        const std::string name = file.filename().string();
        if (ctx_.options.skip_files.contains(name)) {
            util::Logger::debug("Skipping " + name + " because it is in skip_files");
            return {FileStatus::Skipped};
        }

        if (util::Platform::is_heic_file(file)) {
            return process_heic(file, scan_root);
        }

        return process_media(file, file, scan_root);
    } catch (const std::exception& e) {
        util::Logger::error("FileProcessor: " + file.string() + ": " + e.what() + " (op=process)");
        return {FileStatus::Failed};
    }
}

FileReport FileProcessor::process_heic(const fs::path& file, const fs::path& scan_root) {
    if (!ctx_.options.import_mode) {
        util::Logger::debug("Skipping HEIC " + file.string() + " outside import");
        return {FileStatus::Skipped};
    }
    if (!ctx_.transcoder) {
        util::Logger::warn("FileProcessor: no HEIC transcoder, skipping " + file.string());
        return {FileStatus::Skipped};
    }

    util::Logger::info("Converting " + file.string() + " to JPEG");
    auto jpeg = ctx_.transcoder->to_jpeg(file);
    if (!jpeg) {
        util::Logger::error("FileProcessor: HEIC conversion failed for " + file.string() + " (op=transcode)");
        return {FileStatus::Failed};
    }

    FileReport report = process_media(*jpeg, file, scan_root);

    // The staging JPEG is ours; the archive holds its copy now
    std::error_code ec;
    if (fs::exists(*jpeg, ec) && !fs::remove(*jpeg, ec) && ec) {
        util::Logger::warn("FileProcessor: could not remove " + jpeg->string() + ": " + ec.message());
    }

    if (report.status == FileStatus::Failed || report.status == FileStatus::Skipped) {
        return report;
    }

    // The JPEG stands in for the original from here on
    if (ctx_.placement.relocate_duplicate(file, scan_root)) {
        report.moved = true;
    } else {
        util::Logger::error("FileProcessor: could not set aside HEIC original " + file.string() + " (op=relocate)");
    }
    return report;
}

FileReport FileProcessor::process_media(const fs::path& file,
                                        const fs::path& metadata_source,
                                        const fs::path& scan_root) {
    auto media = ctx_.resolver.resolve(metadata_source);
    if (!media) {
        util::Logger::warn("Unknown timestamp, skipping " + file.string());
        return {FileStatus::Skipped};
    }
    media->path = file.string();

    auto fp = util::FileHasher::fingerprint_file(file, ctx_.options.algorithm);
    if (!fp) {
        util::Logger::error("FileProcessor: cannot fingerprint " + file.string() + " (op=hash)");
        return {FileStatus::Failed};
    }

    model::FingerprintRecord candidate;
    candidate.date = media->date;
    candidate.location = media->location.value_or("");

    std::optional<fs::path> reserved;
    if (ctx_.options.import_mode) {
        reserved = ctx_.placement.reserve(ctx_.placement.destination_for(*media, file.filename().string()));
        if (!reserved) {
            return {FileStatus::Failed};
        }
        candidate.canonical_path = ctx_.store.to_stored_path(*reserved);
    } else {
        candidate.canonical_path = ctx_.store.to_stored_path(file);
    }

    DedupResult result = dedup_.classify(*fp, candidate);
    util::Logger::debug("FileProcessor: " + file.string() + " fp=" + fp->hex() + " -> " + to_string(result.outcome));

    FileReport report;
    switch (result.outcome) {
        case DedupOutcome::New:
            report.status = FileStatus::New;
            break;
        case DedupOutcome::StaleReplaced:
            report.status = FileStatus::StaleReplaced;
            break;
        case DedupOutcome::AlreadyArchived:
            report.status = FileStatus::AlreadyArchived;
            break;
        case DedupOutcome::Duplicate:
            report.status = FileStatus::Duplicate;
            break;
        case DedupOutcome::Failed:
            report.status = FileStatus::Failed;
            break;
    }

    if (reserved) {
        if (report.status == FileStatus::New || report.status == FileStatus::StaleReplaced) {
            if (ctx_.placement.copy_to(file, *reserved)) {
                report.copied = true;
            } else {
                util::Logger::error("FileProcessor: could not place " + file.string() + " at " +
                                    reserved->string() + " fp=" + fp->hex() + " (op=copy)");
                // Leave no record pointing at a file that was never written
                if (!ctx_.store.forget(*fp)) {
                    util::Logger::error("FileProcessor: could not roll back record fp=" + fp->hex() +
                                        " path=" + candidate.canonical_path + " (op=forget)");
                }
                report.status = FileStatus::Failed;
            }
        } else {
            ctx_.placement.release(*reserved);
        }
    }

    if (report.status == FileStatus::Duplicate && ctx_.options.move_duplicates) {
        if (ctx_.placement.relocate_duplicate(file, scan_root)) {
            report.moved = true;
        } else {
            util::Logger::error("FileProcessor: could not set aside duplicate " + file.string() +
                                " fp=" + fp->hex() + " (op=relocate)");
        }
    }

    return report;
}

}  // namespace photodb::archive
