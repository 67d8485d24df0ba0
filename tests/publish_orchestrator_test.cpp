#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>
#include "core/publish_orchestrator.hpp"
#include "logging/logger.hpp"
#include "test_fakes.hpp"

class PublishOrchestratorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::setLevel("WARN");
        provider_ = std::make_shared<FakePublishingProvider>();
        config_.max_concurrency = 4;
        config_.max_attempts = 3;
        config_.backoff_base_ms = 1;
        config_.max_backoff_ms = 4;
    }

    static std::vector<TargetVariant> makeVariants(size_t count)
    {
        std::vector<TargetVariant> variants;
        for (size_t i = 0; i < count; ++i)
        {
            AccountTarget target = makeTarget(std::to_string(100 + i));
            variants.push_back({target, makeVariant("v" + std::to_string(i))});
        }
        return variants;
    }

    std::shared_ptr<FakePublishingProvider> provider_;
    PublishConfig config_;
    const int64_t scheduled_at_ = 1893499200;
};

TEST_F(PublishOrchestratorTest, PublishesEveryVariantOnce)
{
    PublishOrchestrator orchestrator(provider_, config_);
    auto variants = makeVariants(6);
    auto outcomes = orchestrator.dispatch(variants, scheduled_at_, "Hello");

    ASSERT_EQ(outcomes.size(), 6u);
    for (size_t i = 0; i < outcomes.size(); ++i)
    {
        EXPECT_EQ(outcomes[i].target.key(), variants[i].target.key());
        EXPECT_EQ(outcomes[i].state, JobState::Succeeded);
        EXPECT_EQ(outcomes[i].attempts, 1);
        EXPECT_EQ(outcomes[i].post_id, "post-" + variants[i].target.account_id);
        EXPECT_EQ(outcomes[i].media.url, variants[i].variant.handle.url);
    }
    EXPECT_EQ(provider_->totalCalls(), 6u);
}

TEST_F(PublishOrchestratorTest, RequestsShareScheduleAndCaption)
{
    PublishOrchestrator orchestrator(provider_, config_);
    auto variants = makeVariants(3);
    orchestrator.dispatch(variants, scheduled_at_, "Same caption");

    std::set<std::string> urls;
    for (const auto &request : provider_->requests())
    {
        EXPECT_EQ(request.scheduled_at, scheduled_at_);
        EXPECT_EQ(request.caption, "Same caption");
        urls.insert(request.media.url);
    }
    EXPECT_EQ(urls.size(), 3u);
}

TEST_F(PublishOrchestratorTest, RejectionIsIsolatedAndNotRetried)
{
    provider_->setHandler([](const PublishRequest &request, int)
                          {
        if (request.account.account_id == "101")
            return PublishResponse{PublishStatus::Rejected, "", "HTTP 400: video format not supported"};
        return PublishResponse{PublishStatus::Ok, "ok-" + request.account.account_id, "scheduled"}; });

    PublishOrchestrator orchestrator(provider_, config_);
    auto outcomes = orchestrator.dispatch(makeVariants(3), scheduled_at_, "");

    EXPECT_EQ(outcomes[0].state, JobState::Succeeded);
    EXPECT_EQ(outcomes[2].state, JobState::Succeeded);
    EXPECT_EQ(outcomes[1].state, JobState::Failed);
    EXPECT_EQ(outcomes[1].error_kind, ErrorKind::PublishRejected);
    EXPECT_EQ(outcomes[1].attempts, 1);
    EXPECT_EQ(provider_->attemptsFor("vk:101"), 1);
}

TEST_F(PublishOrchestratorTest, TransientFailureRetriedUntilSuccess)
{
    provider_->setHandler([](const PublishRequest &request, int attempt)
                          {
        if (attempt < 3)
            return PublishResponse{PublishStatus::Transient, "", "HTTP 503: busy"};
        return PublishResponse{PublishStatus::Ok, "late-" + request.account.account_id, "scheduled"}; });

    PublishOrchestrator orchestrator(provider_, config_);
    auto outcomes = orchestrator.dispatch(makeVariants(2), scheduled_at_, "");

    for (const auto &outcome : outcomes)
    {
        EXPECT_EQ(outcome.state, JobState::Succeeded);
        EXPECT_EQ(outcome.attempts, 3);
        EXPECT_EQ(outcome.error_kind, ErrorKind::None);
    }
    EXPECT_EQ(provider_->totalCalls(), 6u);
}

TEST_F(PublishOrchestratorTest, TransientFailureExhaustsAttempts)
{
    provider_->setHandler([](const PublishRequest &, int)
                          { return PublishResponse{PublishStatus::Transient, "", "request to SmmBox failed: Read"}; });

    PublishOrchestrator orchestrator(provider_, config_);
    auto outcomes = orchestrator.dispatch(makeVariants(1), scheduled_at_, "");

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].state, JobState::Failed);
    EXPECT_EQ(outcomes[0].error_kind, ErrorKind::PublishTransientError);
    EXPECT_EQ(outcomes[0].attempts, 3);
    EXPECT_EQ(provider_->attemptsFor("vk:100"), 3);
}

TEST_F(PublishOrchestratorTest, ProviderExceptionIsNotRetried)
{
    provider_->setHandler([](const PublishRequest &, int attempt) -> PublishResponse
                          {
        if (attempt == 1)
            throw std::runtime_error("socket closed");
        return {PublishStatus::Ok, "42", "scheduled"}; });

    PublishOrchestrator orchestrator(provider_, config_);
    auto outcomes = orchestrator.dispatch(makeVariants(1), scheduled_at_, "");

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].state, JobState::Failed);
    EXPECT_EQ(outcomes[0].attempts, 1);
    EXPECT_EQ(outcomes[0].error_kind, ErrorKind::PublishRejected);
    EXPECT_EQ(outcomes[0].error_message, "provider error: socket closed");
    EXPECT_EQ(provider_->totalCalls(), 1u);
}

TEST_F(PublishOrchestratorTest, AcceptedReplyThatFailsToDecodeIsNeverResubmitted)
{
    provider_->setHandler([](const PublishRequest &, int) -> PublishResponse
                          {
        // Post accepted upstream, then the reply body trips the JSON reader
        auto body = nlohmann::json::parse(R"({"success": {"nested": true}, "response": {"posts": [{"id": 7}]}})");
        bool accepted = body["success"].get<bool>();
        return {accepted ? PublishStatus::Ok : PublishStatus::Rejected, "7", ""}; });

    PublishOrchestrator orchestrator(provider_, config_);
    auto outcomes = orchestrator.dispatch(makeVariants(2), scheduled_at_, "");

    ASSERT_EQ(outcomes.size(), 2u);
    for (const auto &outcome : outcomes)
    {
        EXPECT_EQ(outcome.state, JobState::Failed);
        EXPECT_EQ(outcome.attempts, 1);
        EXPECT_EQ(outcome.error_kind, ErrorKind::PublishRejected);
        EXPECT_EQ(provider_->attemptsFor(outcome.target.key()), 1);
    }
    EXPECT_EQ(provider_->totalCalls(), 2u);
}

TEST_F(PublishOrchestratorTest, ConcurrencyCeilingIsRespected)
{
    config_.max_concurrency = 2;
    provider_->setDelay(std::chrono::milliseconds(30));

    PublishOrchestrator orchestrator(provider_, config_);
    auto outcomes = orchestrator.dispatch(makeVariants(8), scheduled_at_, "");

    for (const auto &outcome : outcomes)
        EXPECT_EQ(outcome.state, JobState::Succeeded);
    EXPECT_LE(provider_->maxConcurrent(), 2);
    EXPECT_GE(provider_->maxConcurrent(), 1);
}

TEST_F(PublishOrchestratorTest, CancelledBeforeDispatchSubmitsNothing)
{
    CancellationSource cancellation;
    cancellation.cancel();

    PublishOrchestrator orchestrator(provider_, config_);
    auto outcomes = orchestrator.dispatch(makeVariants(3), scheduled_at_, "", cancellation.token());

    for (const auto &outcome : outcomes)
    {
        EXPECT_EQ(outcome.state, JobState::Cancelled);
        EXPECT_EQ(outcome.attempts, 0);
    }
    EXPECT_EQ(provider_->totalCalls(), 0u);
}

TEST_F(PublishOrchestratorTest, CancellationDuringBackoffKeepsLastError)
{
    config_.backoff_base_ms = 5000;
    config_.max_backoff_ms = 5000;
    provider_->setHandler([](const PublishRequest &, int)
                          { return PublishResponse{PublishStatus::Transient, "", "HTTP 502: bad gateway"}; });

    CancellationSource cancellation;
    std::thread canceller([&cancellation]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancellation.cancel(); });

    auto started = std::chrono::steady_clock::now();
    PublishOrchestrator orchestrator(provider_, config_);
    auto outcomes = orchestrator.dispatch(makeVariants(1), scheduled_at_, "", cancellation.token());
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].state, JobState::Failed);
    EXPECT_EQ(outcomes[0].error_kind, ErrorKind::PublishTransientError);
    EXPECT_EQ(outcomes[0].error_message, "HTTP 502: bad gateway");
    EXPECT_EQ(outcomes[0].attempts, 1);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(PublishOrchestratorTest, EmptyInputReturnsImmediately)
{
    PublishOrchestrator orchestrator(provider_, config_);
    EXPECT_TRUE(orchestrator.dispatch({}, scheduled_at_, "").empty());
    EXPECT_EQ(provider_->totalCalls(), 0u);
}
