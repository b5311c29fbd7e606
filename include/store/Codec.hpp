#pragma once

#include "model/Media.hpp"
#include "util/FileHasher.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace photodb::store {

// Opaque byte strings as handed to the key-value layer
using Bytes = std::string;

/**
 * Binary serialization for store keys and values.
 *
 * Keys: one namespace tag byte followed by the payload, so fingerprints,
 * directory watermarks and geocode buckets never collide in one table.
 *
 * Values: 4-byte magic, 2-byte version, 1-byte kind, then length-prefixed
 * little-endian fields. Decoders return nullopt on any mismatch or truncation.
 */
class Codec {
public:
    // Keys
    static Bytes fingerprint_key(const util::Fingerprint& fp);
    static Bytes watermark_key(const std::string& directory);
    static Bytes geocode_key(const std::string& bucket);

    // Values
    static Bytes encode_record(const model::FingerprintRecord& record);
    static std::optional<model::FingerprintRecord> decode_record(std::string_view bytes);

    static Bytes encode_watermark(int64_t mtime_ns);
    static std::optional<int64_t> decode_watermark(std::string_view bytes);

    static Bytes encode_address(const model::Address& address);
    static std::optional<model::Address> decode_address(std::string_view bytes);

    static constexpr uint32_t VALUE_MAGIC = 0x31424450;  // 'PDB1' little-endian
    static constexpr uint16_t FORMAT_VERSION = 1;

private:
    enum class Kind : uint8_t {
        Record = 1,
        Watermark = 2,
        Address = 3,
    };

    static constexpr char KEY_FINGERPRINT = 'F';
    static constexpr char KEY_WATERMARK = 'W';
    static constexpr char KEY_GEOCODE = 'G';
};

}  // namespace photodb::store
