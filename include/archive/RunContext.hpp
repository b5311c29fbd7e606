#pragma once

#include "store/FingerprintStore.hpp"
#include "metadata/MetadataResolver.hpp"
#include "metadata/HeicTranscoder.hpp"
#include "archive/PlacementPolicy.hpp"
#include "util/FileHasher.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace photodb::archive {

struct RunOptions {
    bool import_mode = false;      // Copy into the archive layout; staging paths are never canonical
    bool move_duplicates = false;
    bool force = false;            // Ignore directory watermarks
    util::HashAlgorithm algorithm = util::HashAlgorithm::Fnv1a64;
    std::set<std::string> skip_files;
    std::vector<std::filesystem::path> excluded_dirs;
};

// Everything one run shares. Built once in main, borrowed by every component.
struct RunContext {
    RunOptions options;
    store::FingerprintStore& store;
    metadata::MetadataResolver& resolver;
    PlacementPolicy& placement;
    metadata::HeicTranscoder* transcoder = nullptr;
};

}  // namespace photodb::archive
