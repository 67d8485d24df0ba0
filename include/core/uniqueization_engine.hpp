#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "core/batch_result.hpp"
#include "core/cancellation.hpp"
#include "core/encoder_backend.hpp"
#include "core/media_storage.hpp"
#include "core/media_types.hpp"
#include "core/pipeline_config.hpp"
#include "core/transform_spec.hpp"
#include "core/variant_encoder.hpp"

struct UniqueizationResult
{
    std::vector<TargetVariant> variants;          // in target order
    std::vector<PreDispatchFailure> failures;     // in target order
    std::vector<std::string> work_files;          // local files to remove after the batch
};

/**
 * @brief Produces one stored, distinct variant per account target
 *
 * Per target: draw a spec salted with the account key, encode it (hardware
 * first, software on a hardware process failure), reject checksum collisions,
 * then hand the file to storage. Failing targets are reported, never thrown.
 */
class UniqueizationEngine
{
public:
    UniqueizationEngine(TransformSelector selector,
                        std::shared_ptr<VariantEncoder> encoder,
                        std::shared_ptr<EncoderCapability> capability,
                        std::shared_ptr<MediaStorage> storage,
                        UniqueizationConfig config,
                        int max_sessions);

    /**
     * @brief Build variants for every target
     * @param source Probed input, shared read-only by all encodes
     * @param targets Validated, duplicate-free targets
     * @param seed Batch seed mixed into every account's spec
     * @param work_dir Directory for intermediate encodes
     * @param token Targets not yet started when it trips are reported as Cancelled
     */
    UniqueizationResult uniqueize(const SourceMedia &source,
                                  const std::vector<AccountTarget> &targets,
                                  const std::string &seed,
                                  const std::string &work_dir,
                                  const CancellationToken &token = CancellationToken());

private:
    struct TargetOutcome
    {
        bool success = false;
        Variant variant;
        PreDispatchFailure failure;
    };

    TargetOutcome processTarget(const SourceMedia &source, const AccountTarget &target,
                                const std::string &seed, const std::string &work_dir,
                                const CancellationToken &token);

    EncodeResult encodeWithFallback(const SourceMedia &source, const TransformSpec &spec,
                                    const EncoderBackend &backend, const std::string &output_path);

    /**
     * @brief Record the checksum unless it matches the source or an earlier variant
     */
    bool claimChecksum(const std::string &checksum, const std::string &source_checksum);

    static std::string outputFileName(const AccountTarget &target, int attempt);

    TransformSelector selector_;
    std::shared_ptr<VariantEncoder> encoder_;
    std::shared_ptr<EncoderCapability> capability_;
    std::shared_ptr<MediaStorage> storage_;
    UniqueizationConfig config_;
    int max_sessions_;

    std::mutex checksum_mutex_;
    std::set<std::string> seen_checksums_;
};
