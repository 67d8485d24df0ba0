#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>
#include "core/encoder_backend.hpp"
#include "test_fakes.hpp"

TEST(EncoderBackendTest, ParseEncoderListSkipsLegend)
{
    auto encoders = EncoderCapability::parseEncoderList(encoderListing({"libx264", "h264_nvenc"}));

    EXPECT_EQ(encoders.count("libx264"), 1u);
    EXPECT_EQ(encoders.count("h264_nvenc"), 1u);
    EXPECT_EQ(encoders.count("aac"), 1u);
    EXPECT_EQ(encoders.count("="), 0u);
    EXPECT_EQ(encoders.size(), 3u);
}

TEST(EncoderBackendTest, ParseEncoderListWithoutTableIsEmpty)
{
    EXPECT_TRUE(EncoderCapability::parseEncoderList("ffmpeg: command not found").empty());
}

TEST(EncoderBackendTest, ClassifiesEncoderFamilies)
{
    EXPECT_EQ(EncoderBackend::fromEncoderName("h264_nvenc").type, BackendType::Nvenc);
    EXPECT_EQ(EncoderBackend::fromEncoderName("hevc_nvenc").type, BackendType::Nvenc);
    EXPECT_EQ(EncoderBackend::fromEncoderName("h264_qsv").type, BackendType::Qsv);
    EXPECT_EQ(EncoderBackend::fromEncoderName("h264_amf").type, BackendType::Amf);
    EXPECT_EQ(EncoderBackend::fromEncoderName("h264_videotoolbox").type, BackendType::VideoToolbox);
    EXPECT_EQ(EncoderBackend::fromEncoderName("libx264").type, BackendType::Software);
    EXPECT_FALSE(EncoderBackend::fromEncoderName("libx264").isHardware());
    EXPECT_TRUE(EncoderBackend::fromEncoderName("h264_qsv").isHardware());
}

TEST(EncoderBackendTest, PrefersFirstListedHardwareEncoder)
{
    EncoderConfig config;
    config.hardware_preference = {"h264_nvenc", "h264_qsv"};
    auto runner = std::make_shared<FakeProcessRunner>(std::vector<std::string>{"h264_qsv", "h264_nvenc", "libx264"});
    EncoderCapability capability(runner, config);

    ASSERT_TRUE(capability.primary().has_value());
    EXPECT_EQ(capability.primary()->encoder_name, "h264_nvenc");
    ASSERT_TRUE(capability.softwareFallback().has_value());
    EXPECT_EQ(capability.softwareFallback()->encoder_name, "libx264");
}

TEST(EncoderBackendTest, SkipsUnlistedPreferences)
{
    EncoderConfig config;
    config.hardware_preference = {"h264_nvenc", "h264_qsv"};
    auto runner = std::make_shared<FakeProcessRunner>(std::vector<std::string>{"h264_qsv", "libx264"});
    EncoderCapability capability(runner, config);

    ASSERT_TRUE(capability.primary().has_value());
    EXPECT_EQ(capability.primary()->type, BackendType::Qsv);
}

TEST(EncoderBackendTest, SoftwareBecomesPrimaryWithoutHardware)
{
    auto runner = std::make_shared<FakeProcessRunner>(std::vector<std::string>{"libx264"});
    EncoderCapability capability(runner, EncoderConfig());

    ASSERT_TRUE(capability.primary().has_value());
    EXPECT_EQ(capability.primary()->type, BackendType::Software);
    // Nothing to fall back to when software is already primary
    EXPECT_FALSE(capability.softwareFallback().has_value());
}

TEST(EncoderBackendTest, NoEncoderWhenFallbackDisabled)
{
    EncoderConfig config;
    config.allow_software_fallback = false;
    auto runner = std::make_shared<FakeProcessRunner>(std::vector<std::string>{"libx264"});
    EncoderCapability capability(runner, config);

    EXPECT_FALSE(capability.report().hasAny());
    EXPECT_TRUE(capability.report().probe_error.empty());
}

TEST(EncoderBackendTest, FailedProbeReportsError)
{
    auto runner = std::make_shared<FakeProcessRunner>();
    runner->setProbeHandler([](const std::vector<std::string> &)
                            {
        ProcessResult result;
        result.error_message = "Failed to launch ffmpeg: not found";
        return result; });
    EncoderCapability capability(runner, EncoderConfig());

    const CapabilityReport &report = capability.report();
    EXPECT_TRUE(report.probe_ran);
    EXPECT_FALSE(report.hasAny());
    EXPECT_NE(report.probe_error.find("not found"), std::string::npos);
}

TEST(EncoderBackendTest, ProbeRunsOnceAcrossThreads)
{
    auto runner = std::make_shared<FakeProcessRunner>();
    EncoderConfig config;
    config.probe_timeout_seconds = 7;
    EncoderCapability capability(runner, config);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&capability]()
                             { EXPECT_TRUE(capability.report().hasAny()); });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(runner->probeCalls(), 1);
    EXPECT_EQ(runner->lastTimeout(), std::chrono::seconds(7));
}

TEST(EncoderBackendTest, DescribeNamesFamily)
{
    EXPECT_EQ(EncoderBackend::fromEncoderName("h264_nvenc").describe(), "h264_nvenc (NVIDIA NVENC)");
    EXPECT_EQ(EncoderBackend::fromEncoderName("libx264").describe(), "libx264 (software)");
}
