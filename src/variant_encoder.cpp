#include "core/variant_encoder.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace
{
    std::string formatDecimal(double value, int precision)
    {
        std::ostringstream out;
        out.imbue(std::locale::classic());
        out << std::fixed << std::setprecision(precision) << value;
        return out.str();
    }

    int roundEven(double value)
    {
        int rounded = static_cast<int>(std::lround(value / 2.0)) * 2;
        return rounded < 2 ? 2 : rounded;
    }

    std::string stderrTail(const std::string &text, size_t max_lines = 3)
    {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.find_first_not_of(" \t\r") != std::string::npos)
                lines.push_back(line);
        }
        std::string tail;
        size_t start = lines.size() > max_lines ? lines.size() - max_lines : 0;
        for (size_t i = start; i < lines.size(); ++i)
        {
            if (!tail.empty())
                tail += " | ";
            tail += lines[i];
        }
        return tail;
    }

    constexpr const char *kAudioBitrate = "192k";
}

VariantEncoder::VariantEncoder(std::shared_ptr<ProcessRunner> runner,
                               std::shared_ptr<MediaProber> prober,
                               EncoderConfig config,
                               TransformBounds bounds)
    : runner_(std::move(runner)), prober_(std::move(prober)), config_(std::move(config)),
      bounds_(std::move(bounds)), gate_(config_.max_sessions)
{
}

std::string VariantEncoder::buildVideoFilter(const SourceMedia &source, const TransformSpec &spec)
{
    const int width = source.width;
    const int height = source.height;
    std::vector<std::string> filters;

    int cropped_w = width;
    int cropped_h = height;
    if (spec.crop_px > 0 && width > 2 * spec.crop_px && height > 2 * spec.crop_px)
    {
        cropped_w = width - 2 * spec.crop_px;
        cropped_h = height - 2 * spec.crop_px;
        filters.push_back("crop=" + std::to_string(cropped_w) + ":" + std::to_string(cropped_h) + ":" +
                          std::to_string(spec.crop_px) + ":" + std::to_string(spec.crop_px));
    }

    // Zoom by scale_delta relative to the source frame, then crop or pad back to it
    int scaled_w = roundEven(width * (1.0 + spec.scale_delta));
    int scaled_h = roundEven(height * (1.0 + spec.scale_delta));
    filters.push_back("scale=" + std::to_string(scaled_w) + ":" + std::to_string(scaled_h));
    if (scaled_w > width || scaled_h > height)
    {
        int keep_w = std::min(scaled_w, width);
        int keep_h = std::min(scaled_h, height);
        filters.push_back("crop=" + std::to_string(keep_w) + ":" + std::to_string(keep_h) + ":" +
                          std::to_string((scaled_w - keep_w) / 2) + ":" + std::to_string((scaled_h - keep_h) / 2));
        scaled_w = keep_w;
        scaled_h = keep_h;
    }
    if (scaled_w < width || scaled_h < height)
    {
        filters.push_back("pad=" + std::to_string(width) + ":" + std::to_string(height) + ":" +
                          std::to_string((width - scaled_w) / 2) + ":" + std::to_string((height - scaled_h) / 2));
    }
    filters.push_back("setsar=1");

    if (spec.hue_shift_deg != 0.0)
        filters.push_back("hue=h=" + formatDecimal(spec.hue_shift_deg, 3));

    filters.push_back("eq=brightness=" + formatDecimal(spec.brightness, 4) +
                      ":contrast=" + formatDecimal(spec.contrast, 4) +
                      ":saturation=" + formatDecimal(spec.saturation, 4) +
                      ":gamma=" + formatDecimal(spec.gamma, 4));

    if (spec.noise_level > 0.0)
    {
        filters.push_back("noise=alls=" + formatDecimal(spec.noise_level, 2) + ":allf=t+u:all_seed=" +
                          std::to_string(spec.noise_seed));
    }

    if (spec.speed_factor != 1.0)
        filters.push_back("setpts=PTS/" + formatDecimal(spec.speed_factor, 6));

    filters.push_back("format=yuv420p");

    std::string chain;
    for (const auto &filter : filters)
    {
        if (!chain.empty())
            chain += ",";
        chain += filter;
    }
    return chain;
}

std::string VariantEncoder::buildAudioFilter(const SourceMedia &source, const TransformSpec &spec)
{
    if (!source.has_audio)
        return "";
    if (spec.speed_factor == 1.0 && spec.audio_pitch_semitones == 0.0)
        return "";

    const int sample_rate = source.sample_rate > 0 ? source.sample_rate : 44100;
    // asetrate shifts pitch and tempo together; atempo then restores the tempo to speed_factor
    const double pitch_ratio = std::pow(2.0, spec.audio_pitch_semitones / 12.0);
    const int shifted_rate = static_cast<int>(std::lround(sample_rate * pitch_ratio));
    const double tempo = spec.speed_factor / pitch_ratio;

    std::string chain;
    if (spec.audio_pitch_semitones != 0.0)
    {
        chain = "asetrate=" + std::to_string(shifted_rate) + ",aresample=" + std::to_string(sample_rate) + ",";
    }
    chain += "atempo=" + formatDecimal(tempo, 6);
    return chain;
}

std::vector<std::string> VariantEncoder::backendArguments(const EncoderBackend &backend, int bitrate_kbps)
{
    const std::string bitrate = std::to_string(bitrate_kbps) + "k";
    switch (backend.type)
    {
    case BackendType::Nvenc:
        return {"-preset", "p4",
                "-rc", "vbr",
                "-b:v", bitrate,
                "-maxrate", std::to_string(static_cast<int>(bitrate_kbps * 1.5)) + "k",
                "-bufsize", std::to_string(bitrate_kbps * 2) + "k",
                "-rc-lookahead", "20",
                "-spatial-aq", "1",
                "-temporal-aq", "1",
                "-b_ref_mode", "middle"};
    case BackendType::Qsv:
        return {"-global_quality", "23", "-preset", "balanced"};
    case BackendType::Amf:
        return {"-quality", "balanced", "-rc", "vbr_peak", "-b:v", bitrate};
    case BackendType::VideoToolbox:
        return {"-b:v", bitrate, "-allow_sw", "1", "-realtime", "1"};
    case BackendType::Software:
        break;
    }
    // No -crf here: libx264 ignores -b:v when a CRF is set
    return {"-preset", "medium",
            "-b:v", bitrate,
            "-maxrate", std::to_string(static_cast<int>(bitrate_kbps * 1.5)) + "k",
            "-bufsize", std::to_string(bitrate_kbps * 2) + "k"};
}

int VariantEncoder::targetBitrateKbps(const SourceMedia &source, double bitrate_factor)
{
    double base_kbps = 0.0;
    if (source.bit_rate > 0)
    {
        base_kbps = static_cast<double>(source.bit_rate) / 1000.0;
    }
    else
    {
        // Rough estimate from file size when the container reports no bit rate
        double size_mb = static_cast<double>(source.file_size_bytes) / (1024.0 * 1024.0);
        base_kbps = std::max(1000.0, size_mb * 200.0);
    }
    return std::max(1, static_cast<int>(base_kbps * bitrate_factor));
}

std::vector<std::string> VariantEncoder::buildArguments(const SourceMedia &source,
                                                        const TransformSpec &spec,
                                                        const EncoderBackend &backend,
                                                        const std::string &output_path) const
{
    std::vector<std::string> args = {"-hide_banner", "-nostdin", "-y",
                                     "-i", source.path,
                                     "-map", "0:v:0"};

    const std::string audio_filter = buildAudioFilter(source, spec);
    if (source.has_audio)
    {
        args.insert(args.end(), {"-map", "0:a:0?"});
    }

    args.insert(args.end(), {"-vf", buildVideoFilter(source, spec)});

    if (!source.has_audio)
    {
        args.push_back("-an");
    }
    else if (audio_filter.empty())
    {
        args.insert(args.end(), {"-c:a", "copy"});
    }
    else
    {
        args.insert(args.end(), {"-af", audio_filter, "-c:a", "aac", "-b:a", kAudioBitrate});
    }

    args.insert(args.end(), {"-c:v", backend.encoder_name});
    auto rate_control = backendArguments(backend, targetBitrateKbps(source, spec.bitrate_factor));
    args.insert(args.end(), rate_control.begin(), rate_control.end());
    args.insert(args.end(), {"-g", std::to_string(spec.keyframe_interval)});

    // Strip container, stream and chapter metadata; bitexact keeps the encoder tag out
    args.insert(args.end(), {"-map_metadata", "-1",
                             "-map_metadata:s:v", "-1",
                             "-map_metadata:s:a", "-1",
                             "-map_chapters", "-1",
                             "-fflags", "+bitexact",
                             "-flags:v", "+bitexact",
                             "-flags:a", "+bitexact",
                             "-movflags", "+faststart",
                             output_path});
    return args;
}

EncodeResult VariantEncoder::encode(const SourceMedia &source,
                                    const TransformSpec &spec,
                                    const EncoderBackend &backend,
                                    const std::string &output_path)
{
    std::string violation;
    if (!spec.withinBounds(bounds_, &violation))
    {
        Logger::error("Refusing to encode " + spec.salt + ": " + violation);
        return EncodeResult::failure(ErrorKind::OutputValidationFailed, "transform out of bounds: " + violation);
    }

    std::string output_dir = fs::path(output_path).parent_path().string();
    if (!output_dir.empty() && !FileUtils::ensureDirectory(output_dir))
    {
        return EncodeResult::failure(ErrorKind::EncodeProcessFailed, "cannot create output directory " + output_dir);
    }
    if (fs::exists(output_path))
    {
        FileUtils::removeFile(output_path);
    }

    auto args = buildArguments(source, spec, backend, output_path);
    Logger::debug("Encode command for " + spec.salt + ": " +
                  PocoProcessRunner::formatCommandLine(config_.ffmpeg_path, args));

    ProcessResult process;
    {
        SessionGate::Ticket ticket(gate_);
        Logger::info("Encoding variant for " + spec.salt + " with " + backend.describe());
        process = runner_->run(config_.ffmpeg_path, args, std::chrono::seconds(config_.timeout_seconds));
    }

    if (!process.succeeded())
    {
        std::string message = process.error_message;
        std::string tail = stderrTail(process.stderr_text);
        if (!tail.empty())
            message += ": " + tail;
        Logger::error("Encode failed for " + spec.salt + " on " + backend.encoder_name + ": " + message);
        FileUtils::removeFile(output_path);
        return EncodeResult::failure(ErrorKind::EncodeProcessFailed, message);
    }

    std::string validation_error = validateOutput(source, spec, output_path);
    if (!validation_error.empty())
    {
        Logger::error("Output validation failed for " + spec.salt + ": " + validation_error);
        FileUtils::removeFile(output_path);
        return EncodeResult::failure(ErrorKind::OutputValidationFailed, validation_error);
    }

    std::string checksum = FileUtils::computeFileHash(output_path);
    if (checksum.empty())
    {
        FileUtils::removeFile(output_path);
        return EncodeResult::failure(ErrorKind::OutputValidationFailed, "cannot hash output " + output_path);
    }

    EncodeResult result;
    result.success = true;
    result.variant.file_path = output_path;
    result.variant.spec = spec;
    result.variant.checksum = checksum;
    result.variant.backend = backend;
    Logger::info("Variant for " + spec.salt + " ready: " + output_path + " sha256=" + checksum.substr(0, 16));
    return result;
}

std::string VariantEncoder::validateOutput(const SourceMedia &source, const TransformSpec &spec,
                                           const std::string &output_path)
{
    if (!FileUtils::isNonEmptyFile(output_path))
        return "output missing or empty: " + output_path;

    MediaInfo info = prober_->probe(output_path, true);
    if (!info.opened)
        return "output does not open: " + info.error_message;
    if (!info.has_video)
        return "output has no video stream";
    if (!info.video_decodable)
        return "output video does not decode: " + info.error_message;

    if (info.width != source.width || info.height != source.height)
    {
        return "resolution " + std::to_string(info.width) + "x" + std::to_string(info.height) +
               " differs from source " + std::to_string(source.width) + "x" + std::to_string(source.height);
    }

    if (source.duration_seconds > 0.0)
    {
        double expected = source.duration_seconds / spec.speed_factor;
        if (std::fabs(info.duration_seconds - expected) > config_.duration_tolerance_seconds)
        {
            return "duration " + formatDecimal(info.duration_seconds, 3) + "s, expected " +
                   formatDecimal(expected, 3) + "s +-" + formatDecimal(config_.duration_tolerance_seconds, 2);
        }
    }

    for (const auto &[key, value] : info.tags)
    {
        if (!AvMediaProber::isStructuralTag(key))
            return "metadata not stripped: " + key + "=" + value;
    }
    return "";
}
