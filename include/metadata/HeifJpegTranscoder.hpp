#pragma once

#include "metadata/HeicTranscoder.hpp"

namespace photodb::metadata {

/**
 * HeicTranscoder that decodes with libheif and encodes with libavcodec.
 *
 * libheif decodes the primary image whole: grid tiles are composed and
 * rotation/mirroring applied. The RGB result is converted to full-range
 * YUV 4:2:0 and written as one baseline JPEG beside the source as
 * <stem>.jpg. An existing .jpg is never overwritten, and a decode whose
 * size differs from the primary image's is rejected.
 */
class HeifJpegTranscoder : public HeicTranscoder {
public:
    explicit HeifJpegTranscoder(int quality = 2);  // MJPEG qscale, 2 (best) .. 31
    ~HeifJpegTranscoder() override;

    HeifJpegTranscoder(const HeifJpegTranscoder&) = delete;
    HeifJpegTranscoder& operator=(const HeifJpegTranscoder&) = delete;

    [[nodiscard]] std::optional<std::filesystem::path> to_jpeg(const std::filesystem::path& source) override;

private:
    int quality_;
};

}  // namespace photodb::metadata
