#pragma once

#include "metadata/ImageTags.hpp"
#include "metadata/ContainerInfo.hpp"
#include "geo/GeocodeCache.hpp"
#include "model/Media.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace photodb::metadata {

/**
 * MetadataResolver: derives the MediaRecord for one file.
 *
 * Timestamp chain, first hit wins:
 *   1. embedded image tag (DateTimeOriginal, DateTimeDigitized, DateTime)
 *   2. container creation_time (only when the file has no image tags)
 *   3. earlier of the file's ctime and mtime, in local time
 *
 * Coordinates come only from image GPS tags. Locations go through the
 * GeocodeCache and then the display rules in display_location().
 *
 * Thread-safe: holds no mutable state of its own.
 */
class MetadataResolver {
public:
    using LocationOverrides = std::map<std::string, std::string>;

    // Any provider may be null; the corresponding step is then skipped
    MetadataResolver(TagReader* tags,
                     ContainerReader* container,
                     geo::GeocodeCache* geocache,
                     LocationOverrides overrides);

    // nullopt when no timestamp can be resolved; the caller skips the file
    [[nodiscard]] std::optional<model::MediaRecord> resolve(const std::filesystem::path& path) const;

    [[nodiscard]] std::optional<std::string> resolve_location(const model::Coordinate& coordinate) const;

    // "YYYY:MM:DD HH:MM:SS"
    [[nodiscard]] static std::optional<model::LocalDateTime> parse_exif_datetime(const std::string& text);

    // ISO-8601 ("2021-06-01T10:20:30.000000Z") or "UTC 2021-06-01 10:20:30"
    [[nodiscard]] static std::optional<model::LocalDateTime> parse_container_datetime(const std::string& text);

    [[nodiscard]] static std::optional<model::LocalDateTime> filesystem_timestamp(const std::filesystem::path& path);

    [[nodiscard]] static std::optional<model::Coordinate> coordinate_from_tags(const ImageTags& tags);
    [[nodiscard]] static double dms_to_decimal(const DmsTriple& dms);

    [[nodiscard]] static std::string format_date(const model::LocalDateTime& ts);
    [[nodiscard]] static std::string format_year(const model::LocalDateTime& ts);

    // Display string for an address, or nullopt when city, state and road are all empty
    [[nodiscard]] static std::optional<std::string> display_location(const model::Address& address,
                                                                    const LocationOverrides& overrides);

    // "{house_number} {road}, {city}, {state}"
    [[nodiscard]] static std::string override_key(const model::Address& address);

private:
    std::optional<model::LocalDateTime> embedded_timestamp(const ImageTags& tags) const;

    TagReader* tags_;
    ContainerReader* container_;
    geo::GeocodeCache* geocache_;
    LocationOverrides overrides_;
};

}  // namespace photodb::metadata
