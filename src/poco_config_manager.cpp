#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <functional>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    std::string joinInts(const std::vector<int> &values)
    {
        std::string out;
        for (size_t i = 0; i < values.size(); ++i)
        {
            if (i)
                out += ",";
            out += std::to_string(values[i]);
        }
        return out;
    }

    std::string joinStrings(const std::vector<std::string> &values)
    {
        std::string out;
        for (size_t i = 0; i < values.size(); ++i)
        {
            if (i)
                out += ",";
            out += values[i];
        }
        return out;
    }

    std::string trim(const std::string &s)
    {
        auto begin = s.find_first_not_of(" \t");
        if (begin == std::string::npos)
            return "";
        auto end = s.find_last_not_of(" \t");
        return s.substr(begin, end - begin + 1);
    }

    // Knob names in the order they appear under "transform.*"
    const std::vector<std::pair<std::string, RangeBound TransformBounds::*>> kRangeKnobs = {
        {"crop_px", &TransformBounds::crop_px},
        {"scale_delta", &TransformBounds::scale_delta},
        {"hue_shift_deg", &TransformBounds::hue_shift_deg},
        {"noise_level", &TransformBounds::noise_level},
        {"speed_factor", &TransformBounds::speed_factor},
        {"audio_pitch_semitones", &TransformBounds::audio_pitch_semitones},
        {"brightness", &TransformBounds::brightness},
        {"contrast", &TransformBounds::contrast},
        {"saturation", &TransformBounds::saturation},
        {"gamma", &TransformBounds::gamma},
        {"bitrate_factor", &TransformBounds::bitrate_factor}};
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

void PocoConfigManager::resetToDefaults()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = new JSONConfiguration();
    }
    initializeDefaultConfig();
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getLogFile() const
{
    return getString("log_file", "");
}

EncoderConfig PocoConfigManager::getEncoderConfig() const
{
    EncoderConfig def;
    EncoderConfig config;
    config.ffmpeg_path = getString("encoder.ffmpeg_path", def.ffmpeg_path);

    config.hardware_preference.clear();
    for (const auto &name : split(getString("encoder.hardware_preference", joinStrings(def.hardware_preference)), ','))
    {
        auto trimmed = trim(name);
        if (!trimmed.empty())
            config.hardware_preference.push_back(trimmed);
    }

    config.allow_software_fallback = getBool("encoder.allow_software_fallback", def.allow_software_fallback);
    config.software_encoder = getString("encoder.software_encoder", def.software_encoder);
    config.max_sessions = getInt("encoder.max_sessions", def.max_sessions);
    config.timeout_seconds = getInt("encoder.timeout_seconds", def.timeout_seconds);
    config.probe_timeout_seconds = getInt("encoder.probe_timeout_seconds", def.probe_timeout_seconds);
    config.duration_tolerance_seconds = getDouble("validation.duration_tolerance_seconds", def.duration_tolerance_seconds);
    config.work_dir = getString("encoder.work_dir", def.work_dir);
    return config;
}

RangeBound PocoConfigManager::getRange(const std::string &knob, const RangeBound &def) const
{
    RangeBound range;
    range.min = getDouble("transform." + knob + ".min", def.min);
    range.max = getDouble("transform." + knob + ".max", def.max);
    return range;
}

TransformBounds PocoConfigManager::getTransformBounds() const
{
    TransformBounds def;
    TransformBounds bounds;
    for (const auto &[name, member] : kRangeKnobs)
    {
        bounds.*member = getRange(name, def.*member);
    }

    bounds.keyframe_intervals.clear();
    for (const auto &token : split(getString("transform.keyframe_intervals", joinInts(def.keyframe_intervals)), ','))
    {
        auto trimmed = trim(token);
        if (trimmed.empty())
            continue;
        try
        {
            bounds.keyframe_intervals.push_back(std::stoi(trimmed));
        }
        catch (const std::exception &e)
        {
            Logger::warn("Ignoring invalid keyframe interval '" + trimmed + "': " + e.what());
        }
    }
    return bounds;
}

UniqueizationConfig PocoConfigManager::getUniqueizationConfig() const
{
    UniqueizationConfig def;
    UniqueizationConfig config;
    config.max_attempts = getInt("uniqueization.max_attempts", def.max_attempts);
    return config;
}

PublishConfig PocoConfigManager::getPublishConfig() const
{
    PublishConfig def;
    PublishConfig config;
    config.max_concurrency = getInt("publish.max_concurrency", def.max_concurrency);
    config.request_timeout_seconds = getInt("publish.request_timeout_seconds", def.request_timeout_seconds);
    config.max_attempts = getInt("publish.max_attempts", def.max_attempts);
    config.backoff_base_ms = getInt("publish.backoff_base_ms", def.backoff_base_ms);
    config.max_backoff_ms = getInt("publish.max_backoff_ms", def.max_backoff_ms);
    return config;
}

ProviderConfig PocoConfigManager::getProviderConfig() const
{
    ProviderConfig def;
    ProviderConfig config;
    config.api_url = getString("provider.api_url", def.api_url);
    config.api_token = getString("provider.api_token", "");

    // Environment wins over the file so tokens can stay out of config.json
    const char *env_token = std::getenv("SMMBOX_API_TOKEN");
    if (env_token && *env_token)
    {
        config.api_token = env_token;
    }
    return config;
}

StorageConfig PocoConfigManager::getStorageConfig() const
{
    StorageConfig def;
    StorageConfig config;
    config.root_dir = getString("storage.root_dir", def.root_dir);
    config.public_base_url = getString("storage.public_base_url", def.public_base_url);
    return config;
}

ScheduleConfig PocoConfigManager::getScheduleConfig() const
{
    ScheduleConfig def;
    ScheduleConfig config;
    config.utc_offset_minutes = getInt("schedule.utc_offset_minutes", def.utc_offset_minutes);
    return config;
}

bool PocoConfigManager::validateConfig() const
{
    bool valid = true;

    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        valid = false;
    }

    auto encoder = getEncoderConfig();
    if (encoder.ffmpeg_path.empty())
    {
        Logger::error("encoder.ffmpeg_path must not be empty");
        valid = false;
    }
    if (encoder.max_sessions < 1 || encoder.max_sessions > 16)
    {
        Logger::error("Invalid encoder.max_sessions: " + std::to_string(encoder.max_sessions));
        valid = false;
    }
    if (encoder.timeout_seconds <= 0 || encoder.probe_timeout_seconds <= 0)
    {
        Logger::error("Encoder timeouts must be positive");
        valid = false;
    }
    if (encoder.duration_tolerance_seconds < 0.0)
    {
        Logger::error("validation.duration_tolerance_seconds must not be negative");
        valid = false;
    }
    if (encoder.allow_software_fallback && encoder.software_encoder.empty())
    {
        Logger::error("encoder.software_encoder must be set when software fallback is allowed");
        valid = false;
    }

    auto bounds = getTransformBounds();
    for (const auto &[name, member] : kRangeKnobs)
    {
        const RangeBound &range = bounds.*member;
        if (!range.isValid())
        {
            Logger::error("Invalid bounds for transform." + name + ": min " + std::to_string(range.min) +
                          " > max " + std::to_string(range.max));
            valid = false;
        }
    }
    if (bounds.crop_px.min < 0)
    {
        Logger::error("transform.crop_px.min must not be negative");
        valid = false;
    }
    // Crop is drawn in whole pixels
    if (bounds.crop_px.isValid() && std::ceil(bounds.crop_px.min) > std::floor(bounds.crop_px.max))
    {
        Logger::error("transform.crop_px range [" + std::to_string(bounds.crop_px.min) + ", " +
                      std::to_string(bounds.crop_px.max) + "] contains no whole pixel count");
        valid = false;
    }
    if (bounds.noise_level.min < 0)
    {
        Logger::error("transform.noise_level.min must not be negative");
        valid = false;
    }
    if (bounds.scale_delta.min <= -0.5 || bounds.scale_delta.max >= 0.5)
    {
        Logger::error("transform.scale_delta must stay within (-0.5, 0.5)");
        valid = false;
    }
    // atempo accepts 0.5..2.0 per filter instance
    if (bounds.speed_factor.min < 0.5 || bounds.speed_factor.max > 2.0)
    {
        Logger::error("transform.speed_factor must stay within [0.5, 2.0]");
        valid = false;
    }
    if (bounds.audio_pitch_semitones.min < -12.0 || bounds.audio_pitch_semitones.max > 12.0)
    {
        Logger::error("transform.audio_pitch_semitones must stay within [-12, 12]");
        valid = false;
    }
    if (bounds.bitrate_factor.min <= 0.0)
    {
        Logger::error("transform.bitrate_factor must be positive");
        valid = false;
    }
    if (bounds.keyframe_intervals.empty())
    {
        Logger::error("transform.keyframe_intervals must list at least one value");
        valid = false;
    }
    for (int interval : bounds.keyframe_intervals)
    {
        if (interval <= 0)
        {
            Logger::error("Invalid keyframe interval: " + std::to_string(interval));
            valid = false;
        }
    }

    if (getUniqueizationConfig().max_attempts < 1)
    {
        Logger::error("uniqueization.max_attempts must be at least 1");
        valid = false;
    }

    auto publish = getPublishConfig();
    if (publish.max_concurrency < 1 || publish.max_concurrency > 64)
    {
        Logger::error("Invalid publish.max_concurrency: " + std::to_string(publish.max_concurrency));
        valid = false;
    }
    if (publish.request_timeout_seconds <= 0 || publish.max_attempts < 1)
    {
        Logger::error("publish.request_timeout_seconds and publish.max_attempts must be positive");
        valid = false;
    }
    if (publish.backoff_base_ms < 0 || publish.max_backoff_ms < publish.backoff_base_ms)
    {
        Logger::error("Invalid publish backoff: base " + std::to_string(publish.backoff_base_ms) +
                      "ms, max " + std::to_string(publish.max_backoff_ms) + "ms");
        valid = false;
    }

    int offset = getScheduleConfig().utc_offset_minutes;
    if (offset < -14 * 60 || offset > 14 * 60)
    {
        Logger::error("Invalid schedule.utc_offset_minutes: " + std::to_string(offset));
        valid = false;
    }

    return valid;
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");
    cfg_->setString("log_file", "");

    EncoderConfig encoder;
    cfg_->setString("encoder.ffmpeg_path", encoder.ffmpeg_path);
    cfg_->setString("encoder.hardware_preference", joinStrings(encoder.hardware_preference));
    cfg_->setBool("encoder.allow_software_fallback", encoder.allow_software_fallback);
    cfg_->setString("encoder.software_encoder", encoder.software_encoder);
    cfg_->setInt("encoder.max_sessions", encoder.max_sessions);
    cfg_->setInt("encoder.timeout_seconds", encoder.timeout_seconds);
    cfg_->setInt("encoder.probe_timeout_seconds", encoder.probe_timeout_seconds);
    cfg_->setString("encoder.work_dir", encoder.work_dir);
    cfg_->setDouble("validation.duration_tolerance_seconds", encoder.duration_tolerance_seconds);

    TransformBounds bounds;
    for (const auto &[name, member] : kRangeKnobs)
    {
        cfg_->setDouble("transform." + name + ".min", (bounds.*member).min);
        cfg_->setDouble("transform." + name + ".max", (bounds.*member).max);
    }
    cfg_->setString("transform.keyframe_intervals", joinInts(bounds.keyframe_intervals));

    cfg_->setInt("uniqueization.max_attempts", UniqueizationConfig{}.max_attempts);

    PublishConfig publish;
    cfg_->setInt("publish.max_concurrency", publish.max_concurrency);
    cfg_->setInt("publish.request_timeout_seconds", publish.request_timeout_seconds);
    cfg_->setInt("publish.max_attempts", publish.max_attempts);
    cfg_->setInt("publish.backoff_base_ms", publish.backoff_base_ms);
    cfg_->setInt("publish.max_backoff_ms", publish.max_backoff_ms);

    ProviderConfig provider;
    cfg_->setString("provider.api_url", provider.api_url);
    cfg_->setString("provider.api_token", "");

    StorageConfig storage;
    cfg_->setString("storage.root_dir", storage.root_dir);
    cfg_->setString("storage.public_base_url", storage.public_base_url);

    cfg_->setInt("schedule.utc_offset_minutes", ScheduleConfig{}.utc_offset_minutes);
}

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
