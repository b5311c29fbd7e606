#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>

namespace photodb::metadata {

// Degrees, minutes, seconds as stored in the GPS IFD
using DmsTriple = std::array<double, 3>;

// Embedded image tags the resolver cares about. Raw strings, validated later.
struct ImageTags {
    std::optional<std::string> date_time_original;   // Exif.Photo.DateTimeOriginal
    std::optional<std::string> date_time_digitized;  // Exif.Photo.DateTimeDigitized
    std::optional<std::string> date_time;            // Exif.Image.DateTime

    std::optional<DmsTriple> gps_latitude;
    std::optional<std::string> gps_latitude_ref;     // "N" / "S"
    std::optional<DmsTriple> gps_longitude;
    std::optional<std::string> gps_longitude_ref;    // "E" / "W"

    [[nodiscard]] bool empty() const {
        return !date_time_original && !date_time_digitized && !date_time &&
               !gps_latitude && !gps_longitude;
    }
};

class TagReader {
public:
    virtual ~TagReader() = default;

    // nullopt: not a readable image
    [[nodiscard]] virtual std::optional<ImageTags> read(const std::filesystem::path& path) = 0;
};

}  // namespace photodb::metadata
