#pragma once

#include "metadata/ContainerInfo.hpp"

namespace photodb::metadata {

// ContainerReader backed by libavformat; reads header metadata only
class FFmpegContainerReader : public ContainerReader {
public:
    FFmpegContainerReader();

    [[nodiscard]] std::optional<ContainerInfo> read(const std::filesystem::path& path) override;
};

}  // namespace photodb::metadata
