#include "util/FileHasher.hpp"
#include "util/Logger.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <algorithm>
#include <openssl/evp.h>

namespace photodb::util {

std::string Fingerprint::hex() const {
    return FileHasher::to_hex(digest);
}

uint64_t FileHasher::fnv1a64(const uint8_t* data, size_t len, uint64_t state) {
    for (size_t i = 0; i < len; ++i) {
        state ^= data[i];
        state *= FNV_PRIME;
    }
    return state;
}

size_t FileHasher::digest_size(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::Sha256 ? 32 : 8;
}

std::optional<HashAlgorithm> FileHasher::parse_algorithm(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "fnv1a64" || lower == "fnv") return HashAlgorithm::Fnv1a64;
    if (lower == "sha256") return HashAlgorithm::Sha256;
    return std::nullopt;
}

std::string FileHasher::algorithm_name(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::Sha256 ? "sha256" : "fnv1a64";
}

std::string FileHasher::to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::optional<Fingerprint> FileHasher::fingerprint_file(
    const std::filesystem::path& path,
    HashAlgorithm algorithm
) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Logger::error("FileHasher: open failed for " + path.string());
        return std::nullopt;
    }

    auto result = algorithm == HashAlgorithm::Sha256 ? hash_sha256(in) : hash_fnv(in);
    if (!result) {
        Logger::error("FileHasher: read failed for " + path.string());
    }
    return result;
}

std::optional<Fingerprint> FileHasher::hash_fnv(std::ifstream& in) {
    std::vector<char> buffer(CHUNK_SIZE);
    uint64_t state = FNV_OFFSET_BASIS;

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            state = fnv1a64(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<size_t>(got), state);
        }
    }
    if (in.bad()) return std::nullopt;

    // Big-endian so the hex form reads like the integer
    Fingerprint fp;
    fp.algorithm = HashAlgorithm::Fnv1a64;
    fp.digest.resize(8);
    for (int i = 0; i < 8; ++i) {
        fp.digest[i] = static_cast<uint8_t>((state >> (56 - i * 8)) & 0xFF);
    }
    return fp;
}

std::optional<Fingerprint> FileHasher::hash_sha256(std::ifstream& in) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            return std::nullopt;
        }
    }
    if (in.bad()) return std::nullopt;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return std::nullopt;
    }

    Fingerprint fp;
    fp.algorithm = HashAlgorithm::Sha256;
    fp.digest.assign(hash, hash + hash_len);
    return fp;
}

}  // namespace photodb::util
