#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace photodb::metadata {

struct StreamDescriptor {
    std::string media_type;  // "video", "audio", "data", ...
    std::string codec;
    std::optional<std::string> creation_time;
};

struct ContainerInfo {
    std::optional<std::string> creation_time;  // Container-level tag, raw text
    std::vector<StreamDescriptor> streams;

    // Container tag first, then the first stream that carries one
    [[nodiscard]] std::optional<std::string> best_creation_time() const {
        if (creation_time) return creation_time;
        for (const auto& s : streams) {
            if (s.creation_time) return s.creation_time;
        }
        return std::nullopt;
    }
};

class ContainerReader {
public:
    virtual ~ContainerReader() = default;

    // nullopt: not a recognised media container
    [[nodiscard]] virtual std::optional<ContainerInfo> read(const std::filesystem::path& path) = 0;
};

}  // namespace photodb::metadata
