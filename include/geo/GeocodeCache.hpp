#pragma once

#include "geo/ReverseGeocoder.hpp"
#include "store/KeyValueStore.hpp"
#include "util/RateLimiter.hpp"
#include "model/Media.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>

namespace photodb::geo {

/**
 * Persistent memo of reverse-geocode results keyed by coordinate rounded to
 * six decimals. Entries never expire. Misses go to the injected geocoder
 * through the shared rate limiter; failures are not cached.
 *
 * At most one remote call per bucket is in flight. Concurrent misses on the
 * same bucket wait for it and then read the cache.
 */
class GeocodeCache {
public:
    // Throws store::StoreError if the table cannot be opened.
    // geocoder may be null: misses then resolve to nothing.
    GeocodeCache(const std::filesystem::path& db_path,
                 ReverseGeocoder* geocoder,
                 util::RateLimiter& limiter);

    [[nodiscard]] std::optional<model::Address> lookup(const model::Coordinate& coordinate);

    // Reads the cache only, never calls the geocoder
    [[nodiscard]] std::optional<model::Address> cached(const model::Coordinate& coordinate);

    // "%.6f,%.6f" of the rounded coordinate; -0.000000 is normalised to 0.000000
    [[nodiscard]] static std::string bucket_key(const model::Coordinate& coordinate);

    [[nodiscard]] size_t remote_calls() const { return remote_calls_.load(); }

    void close() { kv_.close(); }

private:
    // Blocks while another thread is fetching `bucket`; true once this thread owns it
    bool claim_bucket(const std::string& bucket);
    void release_bucket(const std::string& bucket);

    store::KeyValueStore kv_;
    ReverseGeocoder* geocoder_;
    util::RateLimiter& limiter_;
    std::atomic<size_t> remote_calls_{0};

    std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    std::set<std::string> inflight_;
};

}  // namespace photodb::geo
