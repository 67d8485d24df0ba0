#include "core/publish_orchestrator.hpp"
#include "core/completion_latch.hpp"
#include "core/delay_scheduler.hpp"
#include "core/dispatch_pool.hpp"
#include "core/error_recovery.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <mutex>

JobOutcome PublishJob::toOutcome() const
{
    JobOutcome outcome;
    outcome.target = target;
    outcome.media = variant.handle;
    outcome.state = state;
    outcome.attempts = attempts;
    outcome.post_id = post_id;
    outcome.error_kind = last_error_kind;
    outcome.error_message = last_error;
    return outcome;
}

struct PublishOrchestrator::DispatchContext
{
    DispatchContext(size_t job_count, size_t threads, const CancellationToken &cancel)
        : latch(job_count), pool(threads), token(cancel) {}

    std::vector<PublishJob> jobs;
    std::mutex mutex;
    CompletionLatch latch;
    DispatchPool pool;
    DelayScheduler scheduler;
    CancellationToken token;
};

PublishOrchestrator::PublishOrchestrator(std::shared_ptr<PublishingProvider> provider, PublishConfig config)
    : provider_(std::move(provider)), config_(std::move(config))
{
}

std::vector<JobOutcome> PublishOrchestrator::dispatch(const std::vector<TargetVariant> &variants,
                                                      int64_t scheduled_at,
                                                      const std::string &caption,
                                                      const CancellationToken &token)
{
    std::vector<JobOutcome> outcomes;
    if (variants.empty())
        return outcomes;

    size_t threads = static_cast<size_t>(std::max(1, config_.max_concurrency));
    DispatchContext ctx(variants.size(), threads, token);
    ctx.jobs.reserve(variants.size());
    for (const auto &entry : variants)
    {
        PublishJob job;
        job.target = entry.target;
        job.variant = entry.variant;
        job.caption = caption;
        job.scheduled_at = scheduled_at;
        ctx.jobs.push_back(std::move(job));
    }

    Logger::info("Dispatching " + std::to_string(ctx.jobs.size()) + " publish jobs with concurrency " +
                 std::to_string(ctx.pool.concurrency()));

    for (size_t i = 0; i < ctx.jobs.size(); ++i)
    {
        ctx.pool.enqueue([this, &ctx, i]()
                         { runAttempt(ctx, i); });
    }

    // Wake backed-off jobs early once the batch is cancelled so they can settle
    while (!ctx.latch.waitFor(std::chrono::milliseconds(100)))
    {
        if (ctx.token.isCancelled())
            ctx.scheduler.flush();
    }
    ctx.scheduler.stop();

    std::lock_guard<std::mutex> lock(ctx.mutex);
    outcomes.reserve(ctx.jobs.size());
    for (const auto &job : ctx.jobs)
    {
        outcomes.push_back(job.toOutcome());
    }
    return outcomes;
}

void PublishOrchestrator::runAttempt(DispatchContext &ctx, size_t index)
{
    PublishRequest request;
    {
        std::lock_guard<std::mutex> lock(ctx.mutex);
        PublishJob &job = ctx.jobs[index];
        if (ctx.token.isCancelled())
        {
            if (job.state == JobState::Pending)
            {
                job.state = JobState::Cancelled;
                job.last_error_kind = ErrorKind::Cancelled;
                job.last_error = "batch cancelled before submission";
                Logger::info("Publish job for " + job.target.key() + " cancelled");
            }
            else
            {
                // Already attempted: keep the last transient error as the final word
                job.state = JobState::Failed;
                Logger::warn("Publish job for " + job.target.key() + " abandoned during backoff: " + job.last_error);
            }
            finishJob(ctx, job);
            return;
        }

        job.state = JobState::InFlight;
        ++job.attempts;
        request.account = job.target;
        request.media = job.variant.handle;
        request.caption = job.caption;
        request.scheduled_at = job.scheduled_at;
    }

    PublishResponse response;
    try
    {
        response = provider_->publish(request, std::chrono::seconds(config_.request_timeout_seconds));
    }
    catch (const std::exception &e)
    {
        // The post may already exist upstream, so resubmitting could duplicate it
        response.status = PublishStatus::Rejected;
        response.message = std::string("provider error: ") + e.what();
        Logger::error("Provider threw while publishing to " + request.account.key() + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(ctx.mutex);
    PublishJob &job = ctx.jobs[index];
    switch (response.status)
    {
    case PublishStatus::Ok:
        job.state = JobState::Succeeded;
        job.post_id = response.post_id;
        job.last_error_kind = ErrorKind::None;
        job.last_error.clear();
        Logger::info("Published to " + job.target.key() + " on attempt " + std::to_string(job.attempts));
        finishJob(ctx, job);
        return;

    case PublishStatus::Rejected:
        job.state = JobState::Failed;
        job.last_error_kind = ErrorKind::PublishRejected;
        job.last_error = response.message;
        Logger::error("Publish to " + job.target.key() + " rejected: " + response.message);
        finishJob(ctx, job);
        return;

    case PublishStatus::Transient:
        break;
    }

    job.last_error_kind = ErrorKind::PublishTransientError;
    job.last_error = response.message;

    if (job.attempts >= config_.max_attempts || ctx.token.isCancelled())
    {
        job.state = JobState::Failed;
        Logger::error("Publish to " + job.target.key() + " failed after " + std::to_string(job.attempts) +
                      " attempts: " + response.message);
        finishJob(ctx, job);
        return;
    }

    job.state = JobState::BackingOff;
    auto delay = ErrorRecovery::backoffDelay(job.attempts, config_.backoff_base_ms, config_.max_backoff_ms);
    Logger::warn("Publish to " + job.target.key() + " failed transiently, retrying in " +
                 std::to_string(delay.count()) + "ms (attempt " + std::to_string(job.attempts) + "/" +
                 std::to_string(config_.max_attempts) + "): " + response.message);
    ctx.scheduler.schedule(delay, [this, &ctx, index]()
                           { ctx.pool.enqueue([this, &ctx, index]()
                                              { runAttempt(ctx, index); }); });
}

void PublishOrchestrator::finishJob(DispatchContext &ctx, const PublishJob &job)
{
    Logger::debug("Publish job for " + job.target.key() + " finished " + jobStateName(job.state) +
                  " after " + std::to_string(job.attempts) + " attempts");
    ctx.latch.countDown();
}
