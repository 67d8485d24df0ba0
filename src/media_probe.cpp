#include "core/media_probe.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/error_recovery.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace
{
    void collectTags(const AVDictionary *dict, const std::string &prefix, std::map<std::string, std::string> &out)
    {
        const AVDictionaryEntry *entry = nullptr;
        while ((entry = av_dict_get(dict, "", entry, AV_DICT_IGNORE_SUFFIX)) != nullptr)
        {
            out[prefix + entry->key] = entry->value ? entry->value : "";
        }
    }

    // Stop decoding after this many packets without a frame
    constexpr int kMaxPacketsForFirstFrame = 500;
}

bool AvMediaProber::isStructuralTag(const std::string &key)
{
    static const std::set<std::string> structural = {
        "major_brand", "minor_version", "compatible_brands",
        "handler_name", "vendor_id", "language"};

    std::string name = key;
    auto colon = name.find(':');
    if (name.rfind("stream", 0) == 0 && colon != std::string::npos)
        name = name.substr(colon + 1);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return structural.count(name) > 0;
}

MediaInfo AvMediaProber::probe(const std::string &file_path, bool decode_check)
{
    MediaInfo info;
    AVFormatContextRAII format_ctx;

    int open_result = avformat_open_input(format_ctx.address(), file_path.c_str(), nullptr, nullptr);
    if (open_result < 0)
    {
        info.error_message = "Could not open media file " + file_path + ": " + ErrorRecovery::avErrorString(open_result);
        return info;
    }

    int stream_info_result = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (stream_info_result < 0)
    {
        info.error_message = "Could not find stream information in " + file_path + ": " +
                             ErrorRecovery::avErrorString(stream_info_result);
        return info;
    }

    AVFormatContext *fmt = format_ctx.get();
    info.opened = true;
    info.format_name = fmt->iformat && fmt->iformat->name ? fmt->iformat->name : "";
    if (fmt->duration > 0)
        info.duration_seconds = static_cast<double>(fmt->duration) / AV_TIME_BASE;
    info.bit_rate = fmt->bit_rate;
    collectTags(fmt->metadata, "", info.tags);

    int video_stream_index = -1;
    for (unsigned int i = 0; i < fmt->nb_streams; i++)
    {
        AVStream *stream = fmt->streams[i];
        AVCodecParameters *params = stream->codecpar;
        collectTags(stream->metadata, "stream" + std::to_string(i) + ":", info.tags);

        if (params->codec_type == AVMEDIA_TYPE_VIDEO && video_stream_index < 0)
        {
            // Cover art is exposed as a single-picture video stream
            if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC)
                continue;
            video_stream_index = static_cast<int>(i);
            info.has_video = true;
            info.width = params->width;
            info.height = params->height;
            if (info.duration_seconds <= 0.0 && stream->duration > 0)
                info.duration_seconds = stream->duration * av_q2d(stream->time_base);
        }
        else if (params->codec_type == AVMEDIA_TYPE_AUDIO && !info.has_audio)
        {
            info.has_audio = true;
            info.sample_rate = params->sample_rate;
        }
    }

    if (decode_check && video_stream_index >= 0)
    {
        std::string decode_error;
        info.video_decodable = decodeFirstVideoFrame(fmt, video_stream_index, decode_error);
        if (!info.video_decodable)
        {
            info.error_message = "No decodable video frame in " + file_path + ": " + decode_error;
        }
    }

    Logger::debug("Probed " + file_path + ": " + info.format_name + " " + std::to_string(info.width) + "x" +
                  std::to_string(info.height) + ", " + std::to_string(info.duration_seconds) + "s, audio=" +
                  (info.has_audio ? "yes" : "no") + ", tags=" + std::to_string(info.tags.size()));
    return info;
}

bool AvMediaProber::decodeFirstVideoFrame(AVFormatContext *format_ctx, int stream_index, std::string &error)
{
    AVCodecParameters *codec_params = format_ctx->streams[stream_index]->codecpar;
    const AVCodec *codec = avcodec_find_decoder(codec_params->codec_id);
    if (!codec)
    {
        error = "Unsupported video codec";
        return false;
    }

    AVCodecContextRAII codec_ctx(avcodec_alloc_context3(codec));
    if (!codec_ctx.get())
    {
        error = "Could not allocate decoder context";
        return false;
    }
    if (avcodec_parameters_to_context(codec_ctx.get(), codec_params) < 0)
    {
        error = "Could not copy codec parameters";
        return false;
    }
    int open_result = avcodec_open2(codec_ctx.get(), codec, nullptr);
    if (open_result < 0)
    {
        error = "Could not open decoder: " + ErrorRecovery::avErrorString(open_result);
        return false;
    }

    AVFrameRAII frame;
    AVPacketRAII packet;
    if (!frame.get() || !packet.get())
    {
        error = "Could not allocate frame or packet";
        return false;
    }

    int packets_seen = 0;
    while (packets_seen < kMaxPacketsForFirstFrame && av_read_frame(format_ctx, packet.get()) >= 0)
    {
        if (packet.get()->stream_index != stream_index)
        {
            av_packet_unref(packet.get());
            continue;
        }
        ++packets_seen;
        int response = avcodec_send_packet(codec_ctx.get(), packet.get());
        av_packet_unref(packet.get());
        if (response < 0 && response != AVERROR(EAGAIN))
            continue;

        response = avcodec_receive_frame(codec_ctx.get(), frame.get());
        if (response >= 0)
            return true;
        if (response != AVERROR(EAGAIN))
        {
            error = ErrorRecovery::avErrorString(response);
            return false;
        }
    }

    // Drain frames still buffered in the decoder
    int response = avcodec_send_packet(codec_ctx.get(), nullptr);
    if (response >= 0)
    {
        response = avcodec_receive_frame(codec_ctx.get(), frame.get());
        if (response >= 0)
            return true;
    }

    error = packets_seen == 0 ? "no video packets" : ErrorRecovery::avErrorString(response);
    return false;
}
