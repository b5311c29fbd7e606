#pragma once

#include "store/FingerprintStore.hpp"
#include "model/Media.hpp"
#include "util/FileHasher.hpp"
#include <optional>
#include <string>

namespace photodb::archive {

enum class DedupOutcome {
    New,              // First sighting, record claimed
    StaleReplaced,    // Old record pointed at a missing file; replaced by this one
    AlreadyArchived,  // Record points at this very file
    Duplicate,        // Record points at a different, existing file
    Failed,           // Could not settle a record this run
};

struct DedupResult {
    DedupOutcome outcome = DedupOutcome::Failed;
    std::optional<model::FingerprintRecord> existing;  // Set for Duplicate
};

const char* to_string(DedupOutcome outcome);

/**
 * Decides what a fingerprinted file is relative to the fingerprint store.
 *
 * The candidate record carries the canonical path this file would have if
 * it wins (its own path, or its reserved archive destination on import).
 * Concurrent first sightings are settled by the store's conditional insert:
 * the loser re-reads and becomes a duplicate of the winner.
 */
class DedupEngine {
public:
    explicit DedupEngine(store::FingerprintStore& store);

    [[nodiscard]] DedupResult classify(const util::Fingerprint& fp, const model::FingerprintRecord& candidate);

private:
    // True if the record's file is gone; I/O errors count as present
    bool is_stale(const model::FingerprintRecord& record) const;

    store::FingerprintStore& store_;
};

}  // namespace photodb::archive
