#include "core/encoder_backend.hpp"
#include "logging/logger.hpp"
#include <sstream>

std::string EncoderBackend::describe() const
{
    std::string family;
    switch (type)
    {
    case BackendType::Nvenc:
        family = "NVIDIA NVENC";
        break;
    case BackendType::Qsv:
        family = "Intel Quick Sync";
        break;
    case BackendType::Amf:
        family = "AMD AMF";
        break;
    case BackendType::VideoToolbox:
        family = "Apple VideoToolbox";
        break;
    case BackendType::Software:
        family = "software";
        break;
    }
    return encoder_name + " (" + family + ")";
}

EncoderBackend EncoderBackend::fromEncoderName(const std::string &encoder_name)
{
    EncoderBackend backend;
    backend.encoder_name = encoder_name;
    if (encoder_name.find("nvenc") != std::string::npos)
        backend.type = BackendType::Nvenc;
    else if (encoder_name.find("_qsv") != std::string::npos)
        backend.type = BackendType::Qsv;
    else if (encoder_name.find("_amf") != std::string::npos)
        backend.type = BackendType::Amf;
    else if (encoder_name.find("videotoolbox") != std::string::npos)
        backend.type = BackendType::VideoToolbox;
    else
        backend.type = BackendType::Software;
    return backend;
}

EncoderCapability::EncoderCapability(std::shared_ptr<ProcessRunner> runner, EncoderConfig config)
    : runner_(std::move(runner)), config_(std::move(config))
{
}

const CapabilityReport &EncoderCapability::report()
{
    std::call_once(probe_once_, [this]()
                   { probe(); });
    return report_;
}

std::optional<EncoderBackend> EncoderCapability::softwareFallback()
{
    const auto &r = report();
    if (!r.software_fallback || !r.primary || !r.primary->isHardware())
        return std::nullopt;
    return r.software_fallback;
}

std::set<std::string> EncoderCapability::parseEncoderList(const std::string &output)
{
    std::set<std::string> encoders;
    std::istringstream in(output);
    std::string line;
    bool in_table = false;
    while (std::getline(in, line))
    {
        if (!in_table)
        {
            // Legend ends with a " ------" separator line
            if (line.find("------") != std::string::npos)
                in_table = true;
            continue;
        }
        std::istringstream row(line);
        std::string flags, name;
        if (!(row >> flags >> name))
            continue;
        // Flags column is six characters, first one is the media type (V, A, S)
        if (flags.size() != 6)
            continue;
        encoders.insert(name);
    }
    return encoders;
}

void EncoderCapability::probe()
{
    report_.probe_ran = true;
    ProcessResult result = runner_->run(config_.ffmpeg_path, {"-hide_banner", "-encoders"},
                                        std::chrono::seconds(config_.probe_timeout_seconds));
    if (!result.succeeded())
    {
        report_.probe_error = result.error_message.empty() ? "encoder listing failed" : result.error_message;
        Logger::error("Encoder probe failed: " + report_.probe_error);
        return;
    }

    report_.listed_encoders = parseEncoderList(result.stdout_text);
    Logger::debug("ffmpeg lists " + std::to_string(report_.listed_encoders.size()) + " encoders");

    for (const auto &name : config_.hardware_preference)
    {
        if (report_.listed_encoders.count(name))
        {
            report_.primary = EncoderBackend::fromEncoderName(name);
            break;
        }
    }

    if (config_.allow_software_fallback && report_.listed_encoders.count(config_.software_encoder))
    {
        EncoderBackend software = EncoderBackend::fromEncoderName(config_.software_encoder);
        software.type = BackendType::Software;
        report_.software_fallback = software;
        if (!report_.primary)
            report_.primary = software;
    }

    if (report_.primary)
    {
        bool has_fallback = report_.software_fallback && report_.primary->isHardware();
        Logger::info("Selected encoder backend: " + report_.primary->describe() +
                     (has_fallback ? ", software fallback " + config_.software_encoder : std::string()));
    }
    else
    {
        Logger::error("No usable encoder: none of the preferred hardware encoders are listed and " +
                      std::string(config_.allow_software_fallback ? config_.software_encoder + " is missing"
                                                                  : "software fallback is disabled"));
    }
}
