#include "archive/DedupEngine.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <system_error>

namespace photodb::archive {

const char* to_string(DedupOutcome outcome) {
    switch (outcome) {
        case DedupOutcome::New: return "new";
        case DedupOutcome::StaleReplaced: return "stale-replaced";
        case DedupOutcome::AlreadyArchived: return "already-archived";
        case DedupOutcome::Duplicate: return "duplicate";
        case DedupOutcome::Failed: return "failed";
    }
    return "unknown";
}

DedupEngine::DedupEngine(store::FingerprintStore& store)
    : store_(store) {}

bool DedupEngine::is_stale(const model::FingerprintRecord& record) const {
    auto path = store_.resolve_path(record);
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        util::Logger::warn("DedupEngine: cannot stat " + path.string() + ": " + ec.message() +
                           ", keeping record");
        return false;
    }
    return !std::filesystem::is_regular_file(status);
}

DedupResult DedupEngine::classify(const util::Fingerprint& fp, const model::FingerprintRecord& candidate) {
    bool stale = false;

    if (auto existing = store_.lookup(fp)) {
        if (is_stale(*existing)) {
            util::Logger::debug("DedupEngine: deleting stale record fp=" + fp.hex() +
                                " path=" + existing->canonical_path);
            if (!store_.forget(fp)) {
                util::Logger::error("DedupEngine: could not delete stale record fp=" + fp.hex() + " (op=forget)");
                return {DedupOutcome::Failed, std::nullopt};
            }
            stale = true;
        } else if (existing->canonical_path == candidate.canonical_path) {
            return {DedupOutcome::AlreadyArchived, std::nullopt};
        } else {
            util::Logger::warn("Duplicate found for " + fp.hex() + " (" + candidate.canonical_path +
                               " matches " + existing->canonical_path + ")");
            return {DedupOutcome::Duplicate, existing};
        }
    }

    // One retry: the winner's record may vanish between our failed claim and the re-read
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (store_.claim(fp, candidate)) {
            util::Logger::debug("DedupEngine: created record fp=" + fp.hex() + " path=" + candidate.canonical_path);
            return {stale ? DedupOutcome::StaleReplaced : DedupOutcome::New, std::nullopt};
        }

        if (auto winner = store_.lookup(fp)) {
            if (winner->canonical_path == candidate.canonical_path) {
                return {DedupOutcome::AlreadyArchived, std::nullopt};
            }
            util::Logger::warn("Duplicate found for " + fp.hex() + " (" + candidate.canonical_path +
                               " lost claim to " + winner->canonical_path + ")");
            return {DedupOutcome::Duplicate, winner};
        }
    }

    util::Logger::error("DedupEngine: could not claim fp=" + fp.hex() + " path=" +
                        candidate.canonical_path + " (op=claim)");
    return {DedupOutcome::Failed, std::nullopt};
}

}  // namespace photodb::archive
