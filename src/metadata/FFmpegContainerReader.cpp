#include "metadata/FFmpegContainerReader.hpp"
#include "util/Logger.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}

namespace photodb::metadata {

namespace {

std::optional<std::string> dict_value(AVDictionary* dict, const char* key) {
    AVDictionaryEntry* entry = av_dict_get(dict, key, nullptr, 0);
    if (!entry || !entry->value || entry->value[0] == '\0') return std::nullopt;
    return std::string(entry->value);
}

}  // namespace

FFmpegContainerReader::FFmpegContainerReader() {
    av_log_set_level(AV_LOG_QUIET);
}

std::optional<ContainerInfo> FFmpegContainerReader::read(const std::filesystem::path& path) {
    AVFormatContext* format_ctx = nullptr;

    int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        char errbuf[AV_ERROR_MAX_STRING_SIZE];
        av_strerror(ret, errbuf, sizeof(errbuf));
        util::Logger::debug("FFmpegContainerReader: cannot open " + path.string() + ": " + errbuf);
        return std::nullopt;
    }

    ret = avformat_find_stream_info(format_ctx, nullptr);
    if (ret < 0) {
        util::Logger::debug("FFmpegContainerReader: no stream info for " + path.string());
        avformat_close_input(&format_ctx);
        return std::nullopt;
    }

    ContainerInfo info;
    info.creation_time = dict_value(format_ctx->metadata, "creation_time");

    for (unsigned int i = 0; i < format_ctx->nb_streams; i++) {
        const AVStream* stream = format_ctx->streams[i];

        StreamDescriptor desc;
        const char* type = av_get_media_type_string(stream->codecpar->codec_type);
        desc.media_type = type ? type : "unknown";
        desc.codec = avcodec_get_name(stream->codecpar->codec_id);
        desc.creation_time = dict_value(stream->metadata, "creation_time");
        info.streams.push_back(std::move(desc));
    }

    avformat_close_input(&format_ctx);
    return info;
}

}  // namespace photodb::metadata
