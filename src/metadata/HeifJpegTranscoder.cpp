#include "metadata/HeifJpegTranscoder.hpp"
#include "util/Logger.hpp"
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

#include <libheif/heif.h>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace photodb::metadata {

namespace {

struct HeifContextFreer  { void operator()(heif_context* p) const { heif_context_free(p); } };
struct HeifHandleFreer   { void operator()(heif_image_handle* p) const { heif_image_handle_release(p); } };
struct HeifImageFreer    { void operator()(heif_image* p) const { heif_image_release(p); } };
struct CodecFreer        { void operator()(AVCodecContext* p) const { avcodec_free_context(&p); } };
struct FrameFreer        { void operator()(AVFrame* p) const { av_frame_free(&p); } };
struct PacketFreer       { void operator()(AVPacket* p) const { av_packet_free(&p); } };
struct SwsFreer          { void operator()(SwsContext* p) const { sws_freeContext(p); } };

using HeifContextPtr = std::unique_ptr<heif_context, HeifContextFreer>;
using HeifHandlePtr = std::unique_ptr<heif_image_handle, HeifHandleFreer>;
using HeifImagePtr = std::unique_ptr<heif_image, HeifImageFreer>;
using CodecPtr = std::unique_ptr<AVCodecContext, CodecFreer>;
using FramePtr = std::unique_ptr<AVFrame, FrameFreer>;
using PacketPtr = std::unique_ptr<AVPacket, PacketFreer>;
using SwsPtr = std::unique_ptr<SwsContext, SwsFreer>;

std::string av_error(int code) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(code, errbuf, sizeof(errbuf));
    return errbuf;
}

// Interleaved RGB of the primary image, as displayed
struct RgbImage {
    HeifImagePtr image;
    const uint8_t* pixels = nullptr;
    int stride = 0;
    int width = 0;
    int height = 0;
};

std::optional<RgbImage> decode_primary(const std::filesystem::path& source) {
    HeifContextPtr ctx(heif_context_alloc());
    if (!ctx) return std::nullopt;

    heif_error err = heif_context_read_from_file(ctx.get(), source.c_str(), nullptr);
    if (err.code != heif_error_Ok) {
        util::Logger::error("HeifJpegTranscoder: cannot read " + source.string() + ": " + err.message +
                            " (op=transcode)");
        return std::nullopt;
    }

    heif_image_handle* raw_handle = nullptr;
    err = heif_context_get_primary_image_handle(ctx.get(), &raw_handle);
    if (err.code != heif_error_Ok) {
        util::Logger::error("HeifJpegTranscoder: no primary image in " + source.string() + ": " + err.message +
                            " (op=transcode)");
        return std::nullopt;
    }
    HeifHandlePtr handle(raw_handle);

    const int expected_width = heif_image_handle_get_width(handle.get());
    const int expected_height = heif_image_handle_get_height(handle.get());

    heif_image* raw_image = nullptr;
    err = heif_decode_image(handle.get(), &raw_image, heif_colorspace_RGB, heif_chroma_interleaved_RGB, nullptr);
    if (err.code != heif_error_Ok) {
        util::Logger::error("HeifJpegTranscoder: decode failed for " + source.string() + ": " + err.message +
                            " (op=transcode)");
        return std::nullopt;
    }

    RgbImage out;
    out.image.reset(raw_image);
    out.width = heif_image_get_width(out.image.get(), heif_channel_interleaved);
    out.height = heif_image_get_height(out.image.get(), heif_channel_interleaved);
    out.pixels = heif_image_get_plane_readonly(out.image.get(), heif_channel_interleaved, &out.stride);

    if (!out.pixels || out.width != expected_width || out.height != expected_height) {
        util::Logger::error("HeifJpegTranscoder: " + source.string() + " decoded to " + std::to_string(out.width) +
                            "x" + std::to_string(out.height) + ", expected " + std::to_string(expected_width) +
                            "x" + std::to_string(expected_height) + " (op=transcode)");
        return std::nullopt;
    }
    return out;
}

// One baseline JPEG frame from interleaved RGB
std::optional<std::string> encode_jpeg(const RgbImage& rgb, int quality) {
    const AVCodec* encoder = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
    if (!encoder) {
        util::Logger::error("HeifJpegTranscoder: MJPEG encoder unavailable");
        return std::nullopt;
    }

    CodecPtr enc(avcodec_alloc_context3(encoder));
    if (!enc) return std::nullopt;

    enc->width = rgb.width;
    enc->height = rgb.height;
    enc->pix_fmt = AV_PIX_FMT_YUVJ420P;
    enc->color_range = AVCOL_RANGE_JPEG;
    enc->time_base = AVRational{1, 1};
    enc->flags |= AV_CODEC_FLAG_QSCALE;
    enc->global_quality = FF_QP2LAMBDA * quality;

    int ret = avcodec_open2(enc.get(), encoder, nullptr);
    if (ret < 0) {
        util::Logger::error("HeifJpegTranscoder: encoder setup failed: " + av_error(ret));
        return std::nullopt;
    }

    FramePtr frame(av_frame_alloc());
    if (!frame) return std::nullopt;
    frame->format = enc->pix_fmt;
    frame->width = enc->width;
    frame->height = enc->height;
    frame->quality = enc->global_quality;
    if ((ret = av_frame_get_buffer(frame.get(), 0)) < 0) {
        util::Logger::error("HeifJpegTranscoder: frame allocation failed: " + av_error(ret));
        return std::nullopt;
    }

    SwsPtr sws(sws_getContext(rgb.width, rgb.height, AV_PIX_FMT_RGB24,
                              enc->width, enc->height, enc->pix_fmt,
                              SWS_BICUBIC, nullptr, nullptr, nullptr));
    if (!sws) {
        util::Logger::error("HeifJpegTranscoder: no RGB to YUV conversion available");
        return std::nullopt;
    }
    const uint8_t* src_planes[1] = {rgb.pixels};
    const int src_strides[1] = {rgb.stride};
    sws_scale(sws.get(), src_planes, src_strides, 0, rgb.height, frame->data, frame->linesize);

    PacketPtr packet(av_packet_alloc());
    if (!packet) return std::nullopt;

    if ((ret = avcodec_send_frame(enc.get(), frame.get())) < 0 ||
        (ret = avcodec_send_frame(enc.get(), nullptr)) < 0 ||
        (ret = avcodec_receive_packet(enc.get(), packet.get())) < 0) {
        util::Logger::error("HeifJpegTranscoder: encode failed: " + av_error(ret));
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(packet->data), static_cast<size_t>(packet->size));
}

}  // namespace

HeifJpegTranscoder::HeifJpegTranscoder(int quality)
    : quality_(quality) {
    heif_init(nullptr);
}

HeifJpegTranscoder::~HeifJpegTranscoder() {
    heif_deinit();
}

std::optional<std::filesystem::path> HeifJpegTranscoder::to_jpeg(const std::filesystem::path& source) {
    std::filesystem::path target = source;
    target.replace_extension(".jpg");

    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        util::Logger::warn("HeifJpegTranscoder: " + target.string() + " already exists");
        return std::nullopt;
    }

    auto rgb = decode_primary(source);
    if (!rgb) return std::nullopt;

    auto jpeg = encode_jpeg(*rgb, quality_);
    if (!jpeg) {
        util::Logger::error("HeifJpegTranscoder: no JPEG produced for " + source.string() + " (op=transcode)");
        return std::nullopt;
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out.write(jpeg->data(), static_cast<std::streamsize>(jpeg->size()));
    out.close();
    if (!out) {
        util::Logger::error("HeifJpegTranscoder: cannot write " + target.string() + " (op=transcode)");
        std::filesystem::remove(target, ec);
        return std::nullopt;
    }

    util::Logger::info("HeifJpegTranscoder: " + source.filename().string() + " -> " + target.filename().string() +
                       " (" + std::to_string(rgb->width) + "x" + std::to_string(rgb->height) + ")");
    return target;
}

}  // namespace photodb::metadata
