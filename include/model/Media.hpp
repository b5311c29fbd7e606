#pragma once

#include <string>
#include <optional>
#include <compare>
#include <cstdint>

namespace photodb::model {

// Wall-clock capture time as recorded by the camera or filesystem.
// No timezone: EXIF date-times carry none.
struct LocalDateTime {
    int year = 0;
    int month = 0;   // 1-12
    int day = 0;     // 1-31
    int hour = 0;
    int minute = 0;
    int second = 0;

    auto operator<=>(const LocalDateTime&) const = default;
};

enum class TimestampSource {
    EmbeddedTag,
    Container,
    Filesystem,
};

struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;

    bool operator==(const Coordinate&) const = default;
};

// Reverse-geocode result; every field may be missing.
struct Address {
    std::optional<std::string> house_number;
    std::optional<std::string> road;
    std::optional<std::string> city;
    std::optional<std::string> town;
    std::optional<std::string> county;
    std::optional<std::string> state_code;  // ISO3166-2-lvl4, e.g. "US-CA"
    std::optional<std::string> state;
    std::optional<std::string> country_code;

    [[nodiscard]] bool empty() const {
        return !house_number && !road && !city && !town && !county &&
               !state_code && !state && !country_code;
    }

    bool operator==(const Address&) const = default;
};

// Per-file derived metadata; lives for one processing pass.
struct MediaRecord {
    std::string path;
    LocalDateTime timestamp;
    TimestampSource timestamp_source = TimestampSource::Filesystem;
    std::string date;   // YYYY-MM-DD
    std::string year;   // YYYY
    std::optional<Coordinate> coordinate;
    std::optional<std::string> location;
};

// Persisted mapping from a fingerprint to its canonical archive location.
struct FingerprintRecord {
    std::string canonical_path;  // Relative to the archive root when inside it
    std::string date;
    std::string location;

    bool operator==(const FingerprintRecord&) const = default;
};

}  // namespace photodb::model
