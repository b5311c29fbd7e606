#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <iosfwd>

namespace photodb::util {

enum class HashAlgorithm {
    Fnv1a64,  // 8-byte digest, default
    Sha256,   // 32-byte digest via OpenSSL
};

/**
 * Fixed-width content digest used as the dedup key.
 * Width depends only on the algorithm that produced it.
 */
struct Fingerprint {
    HashAlgorithm algorithm = HashAlgorithm::Fnv1a64;
    std::vector<uint8_t> digest;

    [[nodiscard]] std::string hex() const;
    [[nodiscard]] bool empty() const { return digest.empty(); }

    bool operator==(const Fingerprint&) const = default;
};

class FileHasher {
public:
    // Stream the whole file through the selected algorithm.
    // Returns nullopt if the file cannot be read to the end.
    [[nodiscard]] static std::optional<Fingerprint> fingerprint_file(
        const std::filesystem::path& path,
        HashAlgorithm algorithm = HashAlgorithm::Fnv1a64
    );

    // FNV-1a over every byte; pass the previous result as `state` to continue a stream
    static uint64_t fnv1a64(const uint8_t* data, size_t len, uint64_t state = FNV_OFFSET_BASIS);

    [[nodiscard]] static size_t digest_size(HashAlgorithm algorithm);
    [[nodiscard]] static std::optional<HashAlgorithm> parse_algorithm(const std::string& name);
    [[nodiscard]] static std::string algorithm_name(HashAlgorithm algorithm);

    static std::string to_hex(const std::vector<uint8_t>& bytes);

    static constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
    static constexpr uint64_t FNV_PRIME = 1099511628211ULL;

private:
    static constexpr size_t CHUNK_SIZE = 64 * 1024;

    static std::optional<Fingerprint> hash_fnv(std::ifstream& in);
    static std::optional<Fingerprint> hash_sha256(std::ifstream& in);
};

}  // namespace photodb::util
