#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/encoder_backend.hpp"
#include "core/media_probe.hpp"
#include "core/media_types.hpp"
#include "core/pipeline_config.hpp"
#include "core/pipeline_errors.hpp"
#include "core/process_runner.hpp"
#include "core/session_gate.hpp"

/**
 * @brief Encode result in the ProcessingResult style
 */
struct EncodeResult
{
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    Variant variant;

    static EncodeResult failure(ErrorKind kind, const std::string &message)
    {
        EncodeResult result;
        result.error_kind = kind;
        result.error_message = message;
        return result;
    }
};

/**
 * @brief Turns one TransformSpec into one validated output file
 *
 * Builds the ffmpeg invocation for the chosen backend, runs it under the
 * session gate and checks the output before reporting success.
 */
class VariantEncoder
{
public:
    VariantEncoder(std::shared_ptr<ProcessRunner> runner,
                   std::shared_ptr<MediaProber> prober,
                   EncoderConfig config,
                   TransformBounds bounds);
    virtual ~VariantEncoder() = default;

    /**
     * @brief Encode a variant of @p source
     * @param source Probed input
     * @param spec Parameters to apply; re-checked against the current bounds first
     * @param backend Encoder to drive
     * @param output_path Destination file (overwritten)
     * @return success with the Variant, or EncodeProcessFailed / OutputValidationFailed
     */
    virtual EncodeResult encode(const SourceMedia &source,
                                const TransformSpec &spec,
                                const EncoderBackend &backend,
                                const std::string &output_path);

    /**
     * @brief Full ffmpeg argument list (without the binary itself)
     */
    std::vector<std::string> buildArguments(const SourceMedia &source,
                                            const TransformSpec &spec,
                                            const EncoderBackend &backend,
                                            const std::string &output_path) const;

    static std::string buildVideoFilter(const SourceMedia &source, const TransformSpec &spec);

    /**
     * @brief Audio chain for speed and pitch, empty when audio can be stream-copied
     */
    static std::string buildAudioFilter(const SourceMedia &source, const TransformSpec &spec);

    /**
     * @brief Rate-control flags of the original uniqueizer, per backend family
     */
    static std::vector<std::string> backendArguments(const EncoderBackend &backend, int bitrate_kbps);

    static int targetBitrateKbps(const SourceMedia &source, double bitrate_factor);

    /**
     * @brief Check an encoded file against the source and its TransformSpec
     * @return Empty string when valid, otherwise the first problem found
     */
    std::string validateOutput(const SourceMedia &source, const TransformSpec &spec,
                               const std::string &output_path);

    const EncoderConfig &config() const { return config_; }

protected:
    std::shared_ptr<ProcessRunner> runner_;
    std::shared_ptr<MediaProber> prober_;
    EncoderConfig config_;
    TransformBounds bounds_;
    SessionGate gate_;
};
