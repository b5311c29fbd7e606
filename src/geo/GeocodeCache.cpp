#include "geo/GeocodeCache.hpp"
#include "store/Codec.hpp"
#include "util/Logger.hpp"
#include <cmath>
#include <cstdio>
#include <exception>

namespace photodb::geo {

GeocodeCache::GeocodeCache(const std::filesystem::path& db_path,
                           ReverseGeocoder* geocoder,
                           util::RateLimiter& limiter)
    : kv_(db_path),
      geocoder_(geocoder),
      limiter_(limiter) {}

std::string GeocodeCache::bucket_key(const model::Coordinate& coordinate) {
    auto round6 = [](double v) {
        double r = std::round(v * 1e6) / 1e6;
        return r == 0.0 ? 0.0 : r;  // fold -0.0
    };

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f,%.6f", round6(coordinate.latitude), round6(coordinate.longitude));
    return buf;
}

std::optional<model::Address> GeocodeCache::cached(const model::Coordinate& coordinate) {
    const std::string bucket = bucket_key(coordinate);
    auto bytes = kv_.get(store::Codec::geocode_key(bucket));
    if (!bytes) return std::nullopt;

    auto address = store::Codec::decode_address(*bytes);
    if (!address) {
        util::Logger::error("GeocodeCache: undecodable entry for " + bucket + " (op=lookup)");
    }
    return address;
}

bool GeocodeCache::claim_bucket(const std::string& bucket) {
    std::unique_lock<std::mutex> lock(inflight_mutex_);
    if (!inflight_.contains(bucket)) {
        inflight_.insert(bucket);
        return true;
    }
    inflight_cv_.wait(lock, [&] { return !inflight_.contains(bucket); });
    return false;
}

void GeocodeCache::release_bucket(const std::string& bucket) {
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_.erase(bucket);
    }
    inflight_cv_.notify_all();
}

std::optional<model::Address> GeocodeCache::lookup(const model::Coordinate& coordinate) {
    if (auto hit = cached(coordinate)) {
        return hit;
    }

    if (!geocoder_) {
        return std::nullopt;
    }

    const std::string bucket = bucket_key(coordinate);

    // Whoever fetched before us may have filled the bucket; a failed fetch leaves it to us
    while (!claim_bucket(bucket)) {
        if (auto hit = cached(coordinate)) {
            return hit;
        }
    }

    struct Release {
        GeocodeCache& cache;
        const std::string& bucket;
        ~Release() { cache.release_bucket(bucket); }
    } release{*this, bucket};

    limiter_.acquire();
    if (auto hit = cached(coordinate)) {
        return hit;
    }
    ++remote_calls_;

    std::optional<model::Address> address;
    try {
        address = geocoder_->reverse(coordinate);
    } catch (const std::exception& e) {
        util::Logger::error("GeocodeCache: reverse geocode threw for " + bucket + ": " + e.what() +
                            " (op=geocode)");
        return std::nullopt;
    }

    if (!address || address->empty()) {
        util::Logger::warn("GeocodeCache: no address for " + bucket);
        return std::nullopt;
    }

    if (!kv_.put(store::Codec::geocode_key(bucket), store::Codec::encode_address(*address), false)) {
        util::Logger::debug("GeocodeCache: bucket " + bucket + " already cached");
    } else {
        util::Logger::debug("GeocodeCache: cached " + bucket);
    }
    return address;
}

}  // namespace photodb::geo
