#pragma once

#include <cstdint>
#include <map>
#include <string>

struct AVFormatContext;

/**
 * @brief What a probe learned about one media file
 */
struct MediaInfo
{
    bool opened = false;
    std::string error_message;

    std::string format_name;
    double duration_seconds = 0.0;
    int64_t bit_rate = 0;

    bool has_video = false;
    int width = 0;
    int height = 0;
    bool video_decodable = false;

    bool has_audio = false;
    int sample_rate = 0;

    // Container tags plus per-stream tags keyed "stream<N>:<key>"
    std::map<std::string, std::string> tags;
};

/**
 * @brief Media inspection seam used for source probing and output validation
 */
class MediaProber
{
public:
    virtual ~MediaProber() = default;

    /**
     * @brief Inspect a media file
     * @param file_path File to open
     * @param decode_check Also decode the first video frame
     * @return MediaInfo with opened == false and error_message set on failure
     */
    virtual MediaInfo probe(const std::string &file_path, bool decode_check) = 0;
};

/**
 * @brief MediaProber on libavformat/libavcodec
 */
class AvMediaProber : public MediaProber
{
public:
    MediaInfo probe(const std::string &file_path, bool decode_check) override;

    /**
     * @brief Tags a stripped file may still carry (brand atoms, handler names...)
     */
    static bool isStructuralTag(const std::string &key);

private:
    static bool decodeFirstVideoFrame(AVFormatContext *format_ctx, int stream_index, std::string &error);
};
