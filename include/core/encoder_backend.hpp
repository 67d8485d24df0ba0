#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include "core/pipeline_config.hpp"
#include "core/process_runner.hpp"

enum class BackendType
{
    Nvenc,
    Qsv,
    Amf,
    VideoToolbox,
    Software
};

/**
 * @brief One usable video encoder and the rate-control family its flags belong to
 */
struct EncoderBackend
{
    BackendType type = BackendType::Software;
    std::string encoder_name;

    bool isHardware() const { return type != BackendType::Software; }
    std::string describe() const;

    /**
     * @brief Classify an ffmpeg encoder name ("h264_nvenc", "libx264"...)
     */
    static EncoderBackend fromEncoderName(const std::string &encoder_name);
};

/**
 * @brief Result of the one-time encoder probe
 */
struct CapabilityReport
{
    bool probe_ran = false;
    std::string probe_error;
    std::set<std::string> listed_encoders;
    std::optional<EncoderBackend> primary;
    std::optional<EncoderBackend> software_fallback;

    bool hasAny() const { return primary.has_value(); }
};

/**
 * @brief Lazily probed, process-lifetime view of which encoders work here
 *
 * The first call to report() runs `ffmpeg -hide_banner -encoders`; later calls
 * (from any thread) return the cached result. Owned by the caller and handed to
 * the encoder and the engine explicitly.
 */
class EncoderCapability
{
public:
    EncoderCapability(std::shared_ptr<ProcessRunner> runner, EncoderConfig config);

    const CapabilityReport &report();

    /**
     * @brief Backend every encode starts with: first listed hardware encoder in
     *        preference order, else the permitted software encoder
     */
    std::optional<EncoderBackend> primary() { return report().primary; }

    /**
     * @brief Software encoder to retry with after a hardware process failure
     * @return Empty when fallback is disabled, unavailable, or already the primary
     */
    std::optional<EncoderBackend> softwareFallback();

    /**
     * @brief Parse the encoder table printed by `ffmpeg -encoders`
     * @return Encoder names (second column of every row after the legend)
     */
    static std::set<std::string> parseEncoderList(const std::string &output);

private:
    void probe();

    std::shared_ptr<ProcessRunner> runner_;
    EncoderConfig config_;
    std::once_flag probe_once_;
    CapabilityReport report_;
};
