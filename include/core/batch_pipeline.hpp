#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/account_target.hpp"
#include "core/batch_result.hpp"
#include "core/cancellation.hpp"
#include "core/encoder_backend.hpp"
#include "core/media_probe.hpp"
#include "core/media_storage.hpp"
#include "core/pipeline_config.hpp"
#include "core/publishing_provider.hpp"
#include "core/variant_encoder.hpp"

class PocoConfigManager;

struct BatchRequest
{
    std::string source_path;
    std::vector<AccountTarget> targets;
    std::string scheduled_at;
    std::string caption;
    std::string seed; // random when empty
};

struct PipelineSettings
{
    EncoderConfig encoder;
    TransformBounds bounds;
    UniqueizationConfig uniqueization;
    PublishConfig publish;
    ProviderConfig provider;
    ScheduleConfig schedule;

    static PipelineSettings fromConfig(const PocoConfigManager &config);
};

/**
 * @brief Validates a batch, builds the variants, publishes them and reports
 *
 * Input problems and a missing encoder are thrown (ValidationError,
 * NoEncoderAvailableError) before any encode or publish call. Everything after
 * that is reported per account inside the BatchResult.
 */
class BatchPipeline
{
public:
    BatchPipeline(std::shared_ptr<MediaProber> prober,
                  std::shared_ptr<EncoderCapability> capability,
                  std::shared_ptr<VariantEncoder> encoder,
                  std::shared_ptr<MediaStorage> storage,
                  std::shared_ptr<PublishingProvider> provider,
                  PipelineSettings settings);

    BatchResult run(const BatchRequest &request, const CancellationToken &token = CancellationToken());

    /**
     * @brief Replace the wall clock (unix seconds) used for schedule validation
     */
    void setClock(std::function<int64_t()> clock) { clock_ = std::move(clock); }

    /**
     * @brief Probe and hash the source file
     * @throws ValidationError when the file is missing, unsupported or undecodable
     */
    SourceMedia loadSource(const std::string &path);

    static void validateTargets(const std::vector<AccountTarget> &targets);

    static std::string generateSeed();

private:
    std::shared_ptr<MediaProber> prober_;
    std::shared_ptr<EncoderCapability> capability_;
    std::shared_ptr<VariantEncoder> encoder_;
    std::shared_ptr<MediaStorage> storage_;
    std::shared_ptr<PublishingProvider> provider_;
    PipelineSettings settings_;
    std::function<int64_t()> clock_;
};
