#pragma once

#include <filesystem>
#include <optional>

namespace photodb::metadata {

class HeicTranscoder {
public:
    virtual ~HeicTranscoder() = default;

    // Writes <stem>.jpg beside the source; returns its path or nullopt
    [[nodiscard]] virtual std::optional<std::filesystem::path> to_jpeg(const std::filesystem::path& source) = 0;
};

}  // namespace photodb::metadata
