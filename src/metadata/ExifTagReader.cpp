#include "metadata/ExifTagReader.hpp"
#include "util/Logger.hpp"
#include <exiv2/exiv2.hpp>

namespace photodb::metadata {

namespace {

std::optional<std::string> string_tag(const Exiv2::ExifData& exif, const char* key) {
    auto it = exif.findKey(Exiv2::ExifKey(key));
    if (it == exif.end() || it->count() == 0) return std::nullopt;

    std::string value = it->toString();
    // ASCII tags keep their NUL terminator
    while (!value.empty() && (value.back() == '\0' || value.back() == ' ')) {
        value.pop_back();
    }
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<DmsTriple> dms_tag(const Exiv2::ExifData& exif, const char* key) {
    auto it = exif.findKey(Exiv2::ExifKey(key));
    if (it == exif.end() || it->count() < 3) return std::nullopt;

    DmsTriple dms{};
    for (int i = 0; i < 3; ++i) {
        auto r = it->toRational(i);
        if (r.second == 0) return std::nullopt;
        dms[i] = static_cast<double>(r.first) / static_cast<double>(r.second);
    }
    return dms;
}

}  // namespace

ExifTagReader::ExifTagReader() {
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
    Exiv2::XmpParser::initialize();
}

std::optional<ImageTags> ExifTagReader::read(const std::filesystem::path& path) {
    try {
        auto image = Exiv2::ImageFactory::open(path.string());
        if (!image.get()) return std::nullopt;

        image->readMetadata();
        const Exiv2::ExifData& exif = image->exifData();

        ImageTags tags;
        if (exif.empty()) return tags;

        tags.date_time_original = string_tag(exif, "Exif.Photo.DateTimeOriginal");
        tags.date_time_digitized = string_tag(exif, "Exif.Photo.DateTimeDigitized");
        tags.date_time = string_tag(exif, "Exif.Image.DateTime");

        tags.gps_latitude = dms_tag(exif, "Exif.GPSInfo.GPSLatitude");
        tags.gps_latitude_ref = string_tag(exif, "Exif.GPSInfo.GPSLatitudeRef");
        tags.gps_longitude = dms_tag(exif, "Exif.GPSInfo.GPSLongitude");
        tags.gps_longitude_ref = string_tag(exif, "Exif.GPSInfo.GPSLongitudeRef");
        return tags;
    } catch (const Exiv2::Error& e) {
        // Unknown image type lands here too
        util::Logger::debug("ExifTagReader: " + path.string() + ": " + e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        util::Logger::error("ExifTagReader: " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

}  // namespace photodb::metadata
