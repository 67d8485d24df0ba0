#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/pipeline_config.hpp"

/**
 * @brief Concrete parameter set for one variant
 *
 * Produced by TransformSelector and never modified afterwards. Every numeric
 * knob must lie inside the TransformBounds it was drawn from.
 */
struct TransformSpec
{
    std::string seed;
    std::string salt;

    int crop_px = 0;
    double scale_delta = 0.0;
    double hue_shift_deg = 0.0;
    double noise_level = 0.0;
    double speed_factor = 1.0;
    double audio_pitch_semitones = 0.0;
    double brightness = 0.0;
    double contrast = 1.0;
    double saturation = 1.0;
    double gamma = 1.0;
    double bitrate_factor = 1.0;
    int keyframe_interval = 60;
    uint32_t noise_seed = 0;

    /**
     * @brief Check every knob against the given bounds
     * @param bounds Current configured bounds
     * @param violation Receives the first offending knob, if any
     * @return true when all knobs are inside their intervals
     */
    bool withinBounds(const TransformBounds &bounds, std::string *violation = nullptr) const;

    nlohmann::json toJson() const;

    bool operator==(const TransformSpec &other) const;
    bool operator!=(const TransformSpec &other) const { return !(*this == other); }
};

class TransformSelector
{
public:
    explicit TransformSelector(TransformBounds bounds);

    /**
     * @brief Draw a spec for one account
     * @param seed Batch seed
     * @param salt Account salt, "<platform>:<account_id>"
     * @return The same spec for the same (seed, salt) and bounds
     */
    TransformSpec select(const std::string &seed, const std::string &salt) const;

    const TransformBounds &bounds() const { return bounds_; }

    /**
     * @brief PRNG seed: first 64 bits (big-endian) of SHA-256("<seed>:<salt>")
     */
    static uint64_t deriveSeed(const std::string &seed, const std::string &salt);

private:
    TransformBounds bounds_;
};
