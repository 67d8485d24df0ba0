#include "core/transform_spec.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cmath>
#include <random>

namespace
{
    // 53 random bits mapped onto [0, 1]
    double unitDraw(std::mt19937_64 &rng)
    {
        return static_cast<double>(rng() >> 11) * (1.0 / 9007199254740991.0);
    }

    double drawReal(std::mt19937_64 &rng, const RangeBound &range)
    {
        double u = unitDraw(rng);
        if (range.isPoint())
            return range.min;
        double value = range.min + u * (range.max - range.min);
        // Guard against rounding just past the upper edge
        if (value > range.max)
            value = range.max;
        if (value < range.min)
            value = range.min;
        return value;
    }

    int drawInt(std::mt19937_64 &rng, const RangeBound &range)
    {
        uint64_t raw = rng();
        long long lo = static_cast<long long>(std::ceil(range.min));
        long long hi = static_cast<long long>(std::floor(range.max));
        if (hi <= lo)
            return static_cast<int>(lo);
        uint64_t span = static_cast<uint64_t>(hi - lo) + 1;
        return static_cast<int>(lo + static_cast<long long>(raw % span));
    }

    bool check(const char *name, double value, const RangeBound &range, std::string *violation)
    {
        if (range.contains(value))
            return true;
        if (violation)
        {
            *violation = std::string(name) + "=" + std::to_string(value) + " outside [" +
                         std::to_string(range.min) + ", " + std::to_string(range.max) + "]";
        }
        return false;
    }
}

bool TransformSpec::withinBounds(const TransformBounds &bounds, std::string *violation) const
{
    if (!check("crop_px", crop_px, bounds.crop_px, violation) ||
        !check("scale_delta", scale_delta, bounds.scale_delta, violation) ||
        !check("hue_shift_deg", hue_shift_deg, bounds.hue_shift_deg, violation) ||
        !check("noise_level", noise_level, bounds.noise_level, violation) ||
        !check("speed_factor", speed_factor, bounds.speed_factor, violation) ||
        !check("audio_pitch_semitones", audio_pitch_semitones, bounds.audio_pitch_semitones, violation) ||
        !check("brightness", brightness, bounds.brightness, violation) ||
        !check("contrast", contrast, bounds.contrast, violation) ||
        !check("saturation", saturation, bounds.saturation, violation) ||
        !check("gamma", gamma, bounds.gamma, violation) ||
        !check("bitrate_factor", bitrate_factor, bounds.bitrate_factor, violation))
    {
        return false;
    }

    for (int interval : bounds.keyframe_intervals)
    {
        if (interval == keyframe_interval)
            return true;
    }
    if (violation)
        *violation = "keyframe_interval=" + std::to_string(keyframe_interval) + " not in configured choices";
    return false;
}

nlohmann::json TransformSpec::toJson() const
{
    return nlohmann::json{
        {"seed", seed},
        {"salt", salt},
        {"crop_px", crop_px},
        {"scale_delta", scale_delta},
        {"hue_shift_deg", hue_shift_deg},
        {"noise_level", noise_level},
        {"speed_factor", speed_factor},
        {"audio_pitch_semitones", audio_pitch_semitones},
        {"brightness", brightness},
        {"contrast", contrast},
        {"saturation", saturation},
        {"gamma", gamma},
        {"bitrate_factor", bitrate_factor},
        {"keyframe_interval", keyframe_interval},
        {"noise_seed", noise_seed}};
}

bool TransformSpec::operator==(const TransformSpec &other) const
{
    return seed == other.seed && salt == other.salt && crop_px == other.crop_px &&
           scale_delta == other.scale_delta && hue_shift_deg == other.hue_shift_deg &&
           noise_level == other.noise_level && speed_factor == other.speed_factor &&
           audio_pitch_semitones == other.audio_pitch_semitones && brightness == other.brightness &&
           contrast == other.contrast && saturation == other.saturation && gamma == other.gamma &&
           bitrate_factor == other.bitrate_factor && keyframe_interval == other.keyframe_interval &&
           noise_seed == other.noise_seed;
}

TransformSelector::TransformSelector(TransformBounds bounds) : bounds_(std::move(bounds))
{
}

uint64_t TransformSelector::deriveSeed(const std::string &seed, const std::string &salt)
{
    auto digest = FileUtils::sha256(seed + ":" + salt);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i)
    {
        value = (value << 8) | digest[i];
    }
    return value;
}

TransformSpec TransformSelector::select(const std::string &seed, const std::string &salt) const
{
    std::mt19937_64 rng(deriveSeed(seed, salt));

    TransformSpec spec;
    spec.seed = seed;
    spec.salt = salt;

    // Draw order is part of the reproducibility contract: append new knobs at the end
    spec.crop_px = drawInt(rng, bounds_.crop_px);
    spec.scale_delta = drawReal(rng, bounds_.scale_delta);
    spec.hue_shift_deg = drawReal(rng, bounds_.hue_shift_deg);
    spec.noise_level = drawReal(rng, bounds_.noise_level);
    spec.speed_factor = drawReal(rng, bounds_.speed_factor);
    spec.audio_pitch_semitones = drawReal(rng, bounds_.audio_pitch_semitones);
    spec.brightness = drawReal(rng, bounds_.brightness);
    spec.contrast = drawReal(rng, bounds_.contrast);
    spec.saturation = drawReal(rng, bounds_.saturation);
    spec.gamma = drawReal(rng, bounds_.gamma);
    spec.bitrate_factor = drawReal(rng, bounds_.bitrate_factor);

    uint64_t pick = rng();
    if (!bounds_.keyframe_intervals.empty())
    {
        spec.keyframe_interval = bounds_.keyframe_intervals[pick % bounds_.keyframe_intervals.size()];
    }
    spec.noise_seed = static_cast<uint32_t>(rng() & 0x7fffffffu);

    Logger::debug("Selected transform for " + salt + ": " + spec.toJson().dump());
    return spec;
}
