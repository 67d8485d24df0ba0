#include "core/batch_result.hpp"
#include "logging/logger.hpp"

std::string jobStateName(JobState state)
{
    switch (state)
    {
    case JobState::Pending:
        return "pending";
    case JobState::InFlight:
        return "in_flight";
    case JobState::BackingOff:
        return "backing_off";
    case JobState::Succeeded:
        return "succeeded";
    case JobState::Failed:
        return "failed";
    case JobState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

std::string BatchAggregator::failureReason(const JobOutcome &outcome)
{
    switch (outcome.state)
    {
    case JobState::Cancelled:
    case JobState::Pending:
    case JobState::InFlight:
    case JobState::BackingOff:
        return errorKindName(ErrorKind::Cancelled);
    case JobState::Succeeded:
        return "";
    case JobState::Failed:
        break;
    }

    if (outcome.error_kind == ErrorKind::PublishTransientError)
    {
        return errorKindName(outcome.error_kind) + ": " + outcome.error_message + " (after " +
               std::to_string(outcome.attempts) + (outcome.attempts == 1 ? " attempt)" : " attempts)");
    }
    ErrorKind kind = outcome.error_kind == ErrorKind::None ? ErrorKind::PublishRejected : outcome.error_kind;
    return errorKindName(kind) + ": " + outcome.error_message;
}

BatchResult BatchAggregator::aggregate(const std::vector<JobOutcome> &outcomes,
                                       const std::vector<PreDispatchFailure> &pre_dispatch_failures,
                                       int total_accounts) noexcept
{
    BatchResult result;
    result.total_accounts = total_accounts;
    result.total_videos = static_cast<int>(outcomes.size());

    try
    {
        result.outcomes = outcomes;
        for (const auto &failure : pre_dispatch_failures)
        {
            result.failures.push_back({failure.target, failure.reason});
        }
        for (const auto &outcome : outcomes)
        {
            if (outcome.state == JobState::Succeeded)
            {
                ++result.published;
                continue;
            }
            if (outcome.state != JobState::Failed && outcome.state != JobState::Cancelled)
            {
                Logger::warn("Job for " + outcome.target.key() + " reached aggregation in state " +
                             jobStateName(outcome.state));
            }
            result.failures.push_back({outcome.target, failureReason(outcome)});
        }

        Logger::info("Batch result: " + std::to_string(result.published) + "/" + std::to_string(result.total_accounts) +
                     " published, " + std::to_string(result.total_videos) + " videos, " +
                     std::to_string(result.failures.size()) + " failures");
    }
    catch (const std::exception &e)
    {
        // Only allocation can fail here; keep the counters already computed
        spdlog::error("Batch aggregation incomplete: {}", e.what());
    }
    return result;
}

nlohmann::json BatchResult::toJson() const
{
    nlohmann::json failures_json = nlohmann::json::array();
    for (const auto &failure : failures)
    {
        failures_json.push_back({{"account", failure.account.toJson()}, {"reason", failure.reason}});
    }

    nlohmann::json outcomes_json = nlohmann::json::array();
    for (const auto &outcome : outcomes)
    {
        nlohmann::json entry = {
            {"account", outcome.target.toJson()},
            {"state", jobStateName(outcome.state)},
            {"attempts", outcome.attempts},
            {"media_url", outcome.media.url}};
        if (!outcome.post_id.empty())
            entry["post_id"] = outcome.post_id;
        if (outcome.state != JobState::Succeeded)
            entry["reason"] = BatchAggregator::failureReason(outcome);
        outcomes_json.push_back(entry);
    }

    return nlohmann::json{
        {"total_accounts", total_accounts},
        {"total_videos", total_videos},
        {"published", published},
        {"errors", failures_json},
        {"seed", seed},
        {"scheduled_at", scheduled_at},
        {"jobs", outcomes_json}};
}
