#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/batch_result.hpp"
#include "core/cancellation.hpp"
#include "core/media_types.hpp"
#include "core/pipeline_config.hpp"
#include "core/publishing_provider.hpp"

/**
 * @brief One (account, variant) submission and its retry bookkeeping
 */
struct PublishJob
{
    AccountTarget target;
    Variant variant;
    std::string caption;
    int64_t scheduled_at = 0;

    JobState state = JobState::Pending;
    int attempts = 0;
    std::string post_id;
    ErrorKind last_error_kind = ErrorKind::None;
    std::string last_error;

    JobOutcome toOutcome() const;
};

/**
 * @brief Fans publish jobs out to the provider under a concurrency ceiling
 *
 * Each attempt is one task in a bounded TBB arena. Transient failures are
 * held in BackingOff and re-enqueued through a delay scheduler after
 * exponential backoff, so a job waiting to retry holds no worker. dispatch() returns only after every job
 * has reached Succeeded, Failed or Cancelled.
 */
class PublishOrchestrator
{
public:
    PublishOrchestrator(std::shared_ptr<PublishingProvider> provider, PublishConfig config);

    /**
     * @brief Publish one variant per target
     * @param variants Exactly one entry per dispatched account
     * @param scheduled_at Unix timestamp shared by every post
     * @param caption Shared caption, may be empty
     * @param token Batch cancellation; pending jobs end Cancelled, BackingOff jobs end Failed
     * @return Outcomes in the order of @p variants
     */
    std::vector<JobOutcome> dispatch(const std::vector<TargetVariant> &variants,
                                     int64_t scheduled_at,
                                     const std::string &caption,
                                     const CancellationToken &token = CancellationToken());

    const PublishConfig &config() const { return config_; }

private:
    struct DispatchContext;

    void runAttempt(DispatchContext &ctx, size_t index);
    void finishJob(DispatchContext &ctx, const PublishJob &job);

    std::shared_ptr<PublishingProvider> provider_;
    PublishConfig config_;
};
