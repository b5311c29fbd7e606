#pragma once

#include "metadata/ImageTags.hpp"

namespace photodb::metadata {

// TagReader backed by Exiv2
class ExifTagReader : public TagReader {
public:
    ExifTagReader();

    [[nodiscard]] std::optional<ImageTags> read(const std::filesystem::path& path) override;
};

}  // namespace photodb::metadata
