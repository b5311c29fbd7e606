#include "store/FingerprintStore.hpp"
#include "util/Logger.hpp"

namespace photodb::store {

FingerprintStore::FingerprintStore(const std::filesystem::path& db_path,
                                   const std::filesystem::path& archive_root)
    : kv_(db_path),
      archive_root_(archive_root.lexically_normal()) {
    // "/photos/" -> "/photos" so relative paths never start with an empty element
    if (!archive_root_.empty() && !archive_root_.has_filename() && archive_root_.has_relative_path()) {
        archive_root_ = archive_root_.parent_path();
    }
}

std::optional<model::FingerprintRecord> FingerprintStore::lookup(const util::Fingerprint& fp) {
    auto bytes = kv_.get(Codec::fingerprint_key(fp));
    if (!bytes) return std::nullopt;

    auto record = Codec::decode_record(*bytes);
    if (!record) {
        util::Logger::error("FingerprintStore: undecodable record for fp=" + fp.hex() + " (op=lookup)");
    }
    return record;
}

bool FingerprintStore::claim(const util::Fingerprint& fp, const model::FingerprintRecord& record) {
    return kv_.put(Codec::fingerprint_key(fp), Codec::encode_record(record), false);
}

bool FingerprintStore::replace(const util::Fingerprint& fp, const model::FingerprintRecord& record) {
    bool ok = kv_.put(Codec::fingerprint_key(fp), Codec::encode_record(record), true);
    if (!ok) {
        util::Logger::error("FingerprintStore: replace failed for fp=" + fp.hex() +
                            " path=" + record.canonical_path + " (op=replace)");
    }
    return ok;
}

bool FingerprintStore::forget(const util::Fingerprint& fp) {
    return kv_.remove(Codec::fingerprint_key(fp));
}

std::optional<int64_t> FingerprintStore::watermark(const std::string& directory) {
    auto bytes = kv_.get(Codec::watermark_key(directory));
    if (!bytes) return std::nullopt;

    auto value = Codec::decode_watermark(*bytes);
    if (!value) {
        util::Logger::error("FingerprintStore: undecodable watermark for " + directory + " (op=watermark)");
    }
    return value;
}

bool FingerprintStore::commit_watermark(const std::string& directory, int64_t mtime_ns) {
    bool ok = kv_.put(Codec::watermark_key(directory), Codec::encode_watermark(mtime_ns), true);
    if (!ok) {
        util::Logger::error("FingerprintStore: watermark commit failed for " + directory + " (op=watermark)");
    }
    return ok;
}

bool FingerprintStore::clear_watermark(const std::string& directory) {
    return kv_.remove(Codec::watermark_key(directory));
}

std::string FingerprintStore::to_stored_path(const std::filesystem::path& path) const {
    auto normal = path.lexically_normal();
    if (archive_root_.empty()) return normal.string();

    auto rel = normal.lexically_relative(archive_root_);
    if (rel.empty() || *rel.begin() == "..") {
        return normal.string();
    }
    return rel.string();
}

std::filesystem::path FingerprintStore::resolve_path(const model::FingerprintRecord& record) const {
    std::filesystem::path stored(record.canonical_path);
    if (stored.is_absolute()) return stored;
    return archive_root_ / stored;
}

}  // namespace photodb::store
