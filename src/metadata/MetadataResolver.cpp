#include "metadata/MetadataResolver.hpp"
#include "util/Logger.hpp"
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <format>
#include <utility>

namespace photodb::metadata {

namespace {

bool plausible(const model::LocalDateTime& ts) {
    return ts.year >= 1800 && ts.year <= 9999 &&
           ts.month >= 1 && ts.month <= 12 &&
           ts.day >= 1 && ts.day <= 31 &&
           ts.hour >= 0 && ts.hour <= 23 &&
           ts.minute >= 0 && ts.minute <= 59 &&
           ts.second >= 0 && ts.second <= 60;
}

// Six integers with single separator characters between them; trailing text allowed
std::optional<model::LocalDateTime> scan_fields(const std::string& text, const char* format) {
    model::LocalDateTime ts;
    int consumed = 0;
    int n = std::sscanf(text.c_str(), format,
                        &ts.year, &ts.month, &ts.day, &ts.hour, &ts.minute, &ts.second, &consumed);
    if (n != 6 || !plausible(ts)) return std::nullopt;
    return ts;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

const std::string& or_empty(const std::optional<std::string>& value) {
    static const std::string empty;
    return value ? *value : empty;
}

std::string city_of(const model::Address& a) {
    if (a.city && !a.city->empty()) return *a.city;
    if (a.town && !a.town->empty()) return *a.town;
    if (a.county && !a.county->empty()) return *a.county;
    return "";
}

std::string state_of(const model::Address& a) {
    if (a.state_code && !a.state_code->empty()) {
        const std::string& code = *a.state_code;
        // "US-CA" -> "CA"
        if (code.size() > 3 && code[2] == '-' &&
            std::isalpha(static_cast<unsigned char>(code[0])) &&
            std::isalpha(static_cast<unsigned char>(code[1]))) {
            return code.substr(3);
        }
        return code;
    }
    return or_empty(a.state);
}

}  // namespace

MetadataResolver::MetadataResolver(TagReader* tags,
                                   ContainerReader* container,
                                   geo::GeocodeCache* geocache,
                                   LocationOverrides overrides)
    : tags_(tags),
      container_(container),
      geocache_(geocache),
      overrides_(std::move(overrides)) {}

std::optional<model::LocalDateTime> MetadataResolver::parse_exif_datetime(const std::string& text) {
    return scan_fields(trim(text), "%4d:%2d:%2d %2d:%2d:%2d%n");
}

std::optional<model::LocalDateTime> MetadataResolver::parse_container_datetime(const std::string& text) {
    std::string s = trim(text);
    if (s.starts_with("UTC ")) {
        s = s.substr(4);
    }
    if (auto ts = scan_fields(s, "%4d-%2d-%2dT%2d:%2d:%2d%n")) return ts;
    return scan_fields(s, "%4d-%2d-%2d %2d:%2d:%2d%n");
}

std::optional<model::LocalDateTime> MetadataResolver::filesystem_timestamp(const std::filesystem::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        util::Logger::error("MetadataResolver: stat failed for " + path.string());
        return std::nullopt;
    }

    std::time_t earliest = std::min(st.st_ctim.tv_sec, st.st_mtim.tv_sec);
    std::tm tm{};
    if (!localtime_r(&earliest, &tm)) {
        return std::nullopt;
    }

    model::LocalDateTime ts;
    ts.year = tm.tm_year + 1900;
    ts.month = tm.tm_mon + 1;
    ts.day = tm.tm_mday;
    ts.hour = tm.tm_hour;
    ts.minute = tm.tm_min;
    ts.second = tm.tm_sec;
    return ts;
}

double MetadataResolver::dms_to_decimal(const DmsTriple& dms) {
    return dms[0] + dms[1] / 60.0 + dms[2] / 3600.0;
}

std::optional<model::Coordinate> MetadataResolver::coordinate_from_tags(const ImageTags& tags) {
    if (!tags.gps_latitude || !tags.gps_longitude) {
        return std::nullopt;
    }

    model::Coordinate c;
    c.latitude = dms_to_decimal(*tags.gps_latitude);
    c.longitude = dms_to_decimal(*tags.gps_longitude);

    if (tags.gps_latitude_ref && tags.gps_latitude_ref->starts_with("S")) {
        c.latitude = -c.latitude;
    }
    if (tags.gps_longitude_ref && tags.gps_longitude_ref->starts_with("W")) {
        c.longitude = -c.longitude;
    }
    return c;
}

std::string MetadataResolver::format_date(const model::LocalDateTime& ts) {
    return std::format("{:04}-{:02}-{:02}", ts.year, ts.month, ts.day);
}

std::string MetadataResolver::format_year(const model::LocalDateTime& ts) {
    return std::format("{:04}", ts.year);
}

std::string MetadataResolver::override_key(const model::Address& address) {
    return std::format("{} {}, {}, {}",
                       or_empty(address.house_number), or_empty(address.road),
                       city_of(address), state_of(address));
}

std::optional<std::string> MetadataResolver::display_location(const model::Address& address,
                                                              const LocationOverrides& overrides) {
    auto it = overrides.find(override_key(address));
    if (it != overrides.end()) {
        return it->second;
    }

    const std::string city = city_of(address);
    const std::string state = state_of(address);
    const std::string& road = or_empty(address.road);

    if (city.empty() && state.empty() && road.empty()) {
        return std::nullopt;
    }
    if (!road.empty()) {
        return std::format("{}, {}, {}", road, city, state);
    }
    return std::format("{}, {}", city, state);
}

std::optional<std::string> MetadataResolver::resolve_location(const model::Coordinate& coordinate) const {
    if (!geocache_) return std::nullopt;

    auto address = geocache_->lookup(coordinate);
    if (!address) return std::nullopt;
    return display_location(*address, overrides_);
}

std::optional<model::LocalDateTime> MetadataResolver::embedded_timestamp(const ImageTags& tags) const {
    for (const auto* field : {&tags.date_time_original, &tags.date_time_digitized, &tags.date_time}) {
        if (!*field) continue;
        if (auto ts = parse_exif_datetime(**field)) return ts;
        util::Logger::debug("MetadataResolver: unparseable tag date '" + **field + "'");
    }
    return std::nullopt;
}

std::optional<model::MediaRecord> MetadataResolver::resolve(const std::filesystem::path& path) const {
    model::MediaRecord record;
    record.path = path.string();

    std::optional<ImageTags> tags;
    if (tags_) {
        tags = tags_->read(path);
    }

    std::optional<model::LocalDateTime> ts;
    if (tags) {
        ts = embedded_timestamp(*tags);
        if (ts) record.timestamp_source = model::TimestampSource::EmbeddedTag;
    }

    if (!ts && (!tags || tags->empty()) && container_) {
        if (auto info = container_->read(path)) {
            if (auto raw = info->best_creation_time()) {
                ts = parse_container_datetime(*raw);
                if (ts) {
                    record.timestamp_source = model::TimestampSource::Container;
                } else {
                    util::Logger::debug("MetadataResolver: unparseable creation_time '" + *raw +
                                        "' in " + record.path);
                }
            }
        }
    }

    if (!ts) {
        ts = filesystem_timestamp(path);
        record.timestamp_source = model::TimestampSource::Filesystem;
    }

    if (!ts) {
        return std::nullopt;
    }

    record.timestamp = *ts;
    record.date = format_date(*ts);
    record.year = format_year(*ts);

    if (tags) {
        record.coordinate = coordinate_from_tags(*tags);
        if (record.coordinate) {
            record.location = resolve_location(*record.coordinate);
        }
    }

    return record;
}

}  // namespace photodb::metadata
