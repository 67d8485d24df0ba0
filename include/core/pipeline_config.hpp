#pragma once

#include <string>
#include <vector>

/**
 * @brief Closed interval for one transformation knob
 *
 * A single-point interval (min == max) is valid and makes the knob deterministic.
 */
struct RangeBound
{
    double min = 0.0;
    double max = 0.0;

    bool contains(double value) const { return value >= min && value <= max; }
    bool isPoint() const { return min == max; }
    bool isValid() const { return min <= max; }
};

/**
 * @brief Safe bounds for every knob the selector is allowed to draw
 *
 * Defaults keep variants perceptually identical to the source: a few pixels of
 * crop, +-2% zoom and speed, a few degrees of hue, colour changes of 2-3%.
 */
struct TransformBounds
{
    RangeBound crop_px{0, 8};
    RangeBound scale_delta{-0.02, 0.02};
    RangeBound hue_shift_deg{-5.0, 5.0};
    RangeBound noise_level{0.3, 0.8};
    RangeBound speed_factor{0.98, 1.02};
    RangeBound audio_pitch_semitones{-0.3, 0.3};
    RangeBound brightness{-0.03, 0.03};
    RangeBound contrast{0.98, 1.02};
    RangeBound saturation{0.98, 1.02};
    RangeBound gamma{0.98, 1.02};
    RangeBound bitrate_factor{0.95, 1.05};
    std::vector<int> keyframe_intervals{48, 50, 60, 72, 96};
};

struct EncoderConfig
{
    std::string ffmpeg_path = "ffmpeg";
    std::vector<std::string> hardware_preference{"h264_nvenc", "h264_qsv", "h264_amf", "h264_videotoolbox"};
    bool allow_software_fallback = true;
    std::string software_encoder = "libx264";
    int max_sessions = 1;
    int timeout_seconds = 600;
    int probe_timeout_seconds = 10;
    double duration_tolerance_seconds = 0.5;
    std::string work_dir = "./work";
};

struct UniqueizationConfig
{
    int max_attempts = 2;
};

struct PublishConfig
{
    int max_concurrency = 4;
    int request_timeout_seconds = 30;
    int max_attempts = 3;
    int backoff_base_ms = 500;
    int max_backoff_ms = 8000;
};

struct ProviderConfig
{
    std::string api_url = "https://smmbox.com/api/";
    std::string api_token;
};

struct StorageConfig
{
    std::string root_dir = "./storage";
    std::string public_base_url;
};

struct ScheduleConfig
{
    // Provider timezone for timestamps without a zone designator (Moscow time)
    int utc_offset_minutes = 180;
};
