#pragma once

#include <cstdint>
#include <string>
#include "core/account_target.hpp"
#include "core/encoder_backend.hpp"
#include "core/media_probe.hpp"
#include "core/transform_spec.hpp"

/**
 * @brief Probed, read-only description of the batch input
 */
struct SourceMedia
{
    std::string path;
    std::string format_name;
    double duration_seconds = 0.0;
    int width = 0;
    int height = 0;
    bool has_audio = false;
    int sample_rate = 0;
    int64_t bit_rate = 0;
    uint64_t file_size_bytes = 0;
    std::string checksum;

    static SourceMedia fromProbe(const std::string &path, const MediaInfo &info,
                                 uint64_t file_size_bytes, const std::string &checksum)
    {
        SourceMedia source;
        source.path = path;
        source.format_name = info.format_name;
        source.duration_seconds = info.duration_seconds;
        source.width = info.width;
        source.height = info.height;
        source.has_audio = info.has_audio;
        source.sample_rate = info.sample_rate;
        source.bit_rate = info.bit_rate;
        source.file_size_bytes = file_size_bytes;
        source.checksum = checksum;
        return source;
    }
};

/**
 * @brief Location of a stored variant as the provider will fetch it
 */
struct MediaHandle
{
    std::string key;
    std::string url;
};

/**
 * @brief One encoded, validated output file
 */
struct Variant
{
    std::string file_path;
    TransformSpec spec;
    std::string checksum;
    EncoderBackend backend;
    MediaHandle handle;
};

struct TargetVariant
{
    AccountTarget target;
    Variant variant;
};
