#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/account_target.hpp"
#include "core/media_types.hpp"
#include "core/pipeline_errors.hpp"

enum class JobState
{
    Pending,
    InFlight,
    BackingOff,
    Succeeded,
    Failed,
    Cancelled
};

std::string jobStateName(JobState state);

/**
 * @brief Terminal record of one publish job
 */
struct JobOutcome
{
    AccountTarget target;
    MediaHandle media;
    JobState state = JobState::Pending;
    int attempts = 0;
    std::string post_id;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

/**
 * @brief A target that never reached dispatch (failed or skipped uniqueization)
 */
struct PreDispatchFailure
{
    AccountTarget target;
    ErrorKind kind = ErrorKind::UniqueizationFailed;
    std::string reason;
};

struct FailureEntry
{
    AccountTarget account;
    std::string reason;
};

struct BatchResult
{
    int total_accounts = 0;
    int total_videos = 0;
    int published = 0;
    std::vector<FailureEntry> failures;

    std::string seed;
    int64_t scheduled_at = 0;
    std::vector<JobOutcome> outcomes;

    nlohmann::json toJson() const;
};

class BatchAggregator
{
public:
    /**
     * @brief Merge dispatch outcomes and pre-dispatch failures into one report
     * @param outcomes One entry per dispatched job, each in a terminal state
     * @param pre_dispatch_failures Targets excluded before dispatch
     * @param total_accounts Number of targets the batch was started with
     * @return Never throws; unexpected states are reported as failures
     */
    static BatchResult aggregate(const std::vector<JobOutcome> &outcomes,
                                 const std::vector<PreDispatchFailure> &pre_dispatch_failures,
                                 int total_accounts) noexcept;

    /**
     * @brief Failure reason recorded for a non-succeeded job
     */
    static std::string failureReason(const JobOutcome &outcome);
};
