#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>
#include "core/file_utils.hpp"
#include "core/variant_encoder.hpp"
#include "test_base.hpp"
#include "test_fakes.hpp"

class VariantEncoderTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        runner_ = std::make_shared<FakeProcessRunner>();
        prober_ = std::make_shared<FakeMediaProber>();
        source_ = makeSource(createDummyFile("source.mp4", "source bytes"));
    }

    std::unique_ptr<VariantEncoder> makeEncoder(int max_sessions = 1)
    {
        EncoderConfig config;
        config.max_sessions = max_sessions;
        config.timeout_seconds = 42;
        return std::make_unique<VariantEncoder>(runner_, prober_, config, TransformBounds());
    }

    static TransformSpec sampleSpec()
    {
        TransformSpec spec;
        spec.seed = "seed";
        spec.salt = "vk:1001";
        spec.crop_px = 4;
        spec.scale_delta = 0.01;
        spec.hue_shift_deg = 2.5;
        spec.noise_level = 0.5;
        spec.speed_factor = 1.01;
        spec.audio_pitch_semitones = 0.0;
        spec.brightness = 0.01;
        spec.contrast = 1.01;
        spec.saturation = 1.0;
        spec.gamma = 1.0;
        spec.bitrate_factor = 1.0;
        spec.keyframe_interval = 60;
        spec.noise_seed = 1234;
        return spec;
    }

    std::shared_ptr<FakeProcessRunner> runner_;
    std::shared_ptr<FakeMediaProber> prober_;
    SourceMedia source_;
};

TEST_F(VariantEncoderTest, VideoFilterAppliesEveryTransform)
{
    EXPECT_EQ(VariantEncoder::buildVideoFilter(source_, sampleSpec()),
              "crop=1272:712:4:4,scale=1292:728,crop=1280:720:6:4,setsar=1,hue=h=2.500,"
              "eq=brightness=0.0100:contrast=1.0100:saturation=1.0000:gamma=1.0000,"
              "noise=alls=0.50:allf=t+u:all_seed=1234,setpts=PTS/1.010000,format=yuv420p");
}

TEST_F(VariantEncoderTest, ShrinkingScalePadsBackToSourceSize)
{
    TransformSpec spec = sampleSpec();
    spec.crop_px = 0;
    spec.scale_delta = -0.02;
    spec.hue_shift_deg = 0.0;
    spec.speed_factor = 1.0;

    std::string filter = VariantEncoder::buildVideoFilter(source_, spec);
    EXPECT_EQ(filter.rfind("scale=1254:706,pad=1280:720:13:7,setsar=1", 0), 0u) << filter;
    EXPECT_EQ(filter.find("hue="), std::string::npos);
    EXPECT_EQ(filter.find("setpts="), std::string::npos);
}

TEST_F(VariantEncoderTest, AudioCopiedWhenSpeedAndPitchNeutral)
{
    TransformSpec spec = sampleSpec();
    spec.speed_factor = 1.0;
    spec.audio_pitch_semitones = 0.0;

    EXPECT_TRUE(VariantEncoder::buildAudioFilter(source_, spec).empty());
    auto args = makeEncoder()->buildArguments(source_, spec, EncoderBackend::fromEncoderName("libx264"), "out.mp4");
    EXPECT_EQ(argumentAfter(args, "-c:a"), "copy");
    EXPECT_FALSE(hasArgument(args, "-af"));
}

TEST_F(VariantEncoderTest, AudioFollowsSpeedAndPitch)
{
    TransformSpec spec = sampleSpec();
    EXPECT_EQ(VariantEncoder::buildAudioFilter(source_, spec), "atempo=1.010000");

    spec.speed_factor = 1.0;
    spec.audio_pitch_semitones = 1.0;
    std::string filter = VariantEncoder::buildAudioFilter(source_, spec);
    EXPECT_EQ(filter.rfind("asetrate=50854,aresample=48000,atempo=0.94", 0), 0u) << filter;

    auto args = makeEncoder()->buildArguments(source_, spec, EncoderBackend::fromEncoderName("libx264"), "out.mp4");
    EXPECT_EQ(argumentAfter(args, "-af"), filter);
    EXPECT_EQ(argumentAfter(args, "-c:a"), "aac");
}

TEST_F(VariantEncoderTest, SilentSourceDropsAudio)
{
    source_.has_audio = false;
    auto args = makeEncoder()->buildArguments(source_, sampleSpec(), EncoderBackend::fromEncoderName("libx264"), "out.mp4");

    EXPECT_TRUE(hasArgument(args, "-an"));
    EXPECT_FALSE(hasArgument(args, "0:a:0?"));
    EXPECT_TRUE(VariantEncoder::buildAudioFilter(source_, sampleSpec()).empty());
}

TEST_F(VariantEncoderTest, ArgumentsStripMetadataAndSelectBackend)
{
    auto args = makeEncoder()->buildArguments(source_, sampleSpec(), EncoderBackend::fromEncoderName("h264_nvenc"),
                                              "/tmp/out.mp4");

    EXPECT_EQ(argumentAfter(args, "-i"), source_.path);
    EXPECT_EQ(argumentAfter(args, "-c:v"), "h264_nvenc");
    EXPECT_EQ(argumentAfter(args, "-preset"), "p4");
    EXPECT_EQ(argumentAfter(args, "-b:v"), "4000k");
    EXPECT_EQ(argumentAfter(args, "-maxrate"), "6000k");
    EXPECT_EQ(argumentAfter(args, "-g"), "60");
    EXPECT_EQ(argumentAfter(args, "-map_metadata"), "-1");
    EXPECT_EQ(argumentAfter(args, "-map_metadata:s:v"), "-1");
    EXPECT_EQ(argumentAfter(args, "-map_chapters"), "-1");
    EXPECT_EQ(argumentAfter(args, "-fflags"), "+bitexact");
    EXPECT_EQ(argumentAfter(args, "-flags:v"), "+bitexact");
    EXPECT_EQ(args.back(), "/tmp/out.mp4");
}

TEST_F(VariantEncoderTest, BackendFamiliesUseTheirRateControl)
{
    auto qsv = VariantEncoder::backendArguments(EncoderBackend::fromEncoderName("h264_qsv"), 3000);
    EXPECT_EQ(argumentAfter(qsv, "-global_quality"), "23");

    auto amf = VariantEncoder::backendArguments(EncoderBackend::fromEncoderName("h264_amf"), 3000);
    EXPECT_EQ(argumentAfter(amf, "-rc"), "vbr_peak");

    auto software = VariantEncoder::backendArguments(EncoderBackend::fromEncoderName("libx264"), 3000);
    EXPECT_FALSE(hasArgument(software, "-crf"));
    EXPECT_EQ(argumentAfter(software, "-b:v"), "3000k");
    EXPECT_EQ(argumentAfter(software, "-maxrate"), "4500k");
    EXPECT_EQ(argumentAfter(software, "-bufsize"), "6000k");
}

TEST_F(VariantEncoderTest, SoftwareBitrateFollowsBitrateFactor)
{
    auto low = VariantEncoder::backendArguments(EncoderBackend::fromEncoderName("libx264"),
                                                VariantEncoder::targetBitrateKbps(source_, 0.95));
    auto high = VariantEncoder::backendArguments(EncoderBackend::fromEncoderName("libx264"),
                                                 VariantEncoder::targetBitrateKbps(source_, 1.05));
    EXPECT_NE(argumentAfter(low, "-b:v"), argumentAfter(high, "-b:v"));
    EXPECT_FALSE(hasArgument(high, "-crf"));
}

TEST_F(VariantEncoderTest, BitrateEstimatedFromSizeWhenUnknown)
{
    source_.bit_rate = 0;
    source_.file_size_bytes = 50ull * 1024 * 1024;
    EXPECT_EQ(VariantEncoder::targetBitrateKbps(source_, 1.0), 10000);

    source_.file_size_bytes = 1024 * 1024;
    EXPECT_EQ(VariantEncoder::targetBitrateKbps(source_, 1.0), 1000);

    source_.bit_rate = 2000000;
    EXPECT_EQ(VariantEncoder::targetBitrateKbps(source_, 1.05), 2100);
}

TEST_F(VariantEncoderTest, EncodeProducesHashedVariant)
{
    auto encoder = makeEncoder();
    std::string output = pathInTestDir("variants/vk_1001_1.mp4");
    EncodeResult result = encoder->encode(source_, sampleSpec(), EncoderBackend::fromEncoderName("h264_nvenc"), output);

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.variant.file_path, output);
    EXPECT_EQ(result.variant.checksum, FileUtils::computeFileHash(output));
    EXPECT_EQ(result.variant.backend.encoder_name, "h264_nvenc");
    EXPECT_EQ(result.variant.spec, sampleSpec());
    EXPECT_EQ(runner_->lastTimeout(), std::chrono::seconds(42));
}

TEST_F(VariantEncoderTest, OutOfBoundsSpecIsRefused)
{
    TransformSpec spec = sampleSpec();
    spec.speed_factor = 1.5;

    EncodeResult result = makeEncoder()->encode(source_, spec, EncoderBackend::fromEncoderName("libx264"),
                                                pathInTestDir("out.mp4"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::OutputValidationFailed);
    EXPECT_NE(result.error_message.find("speed_factor"), std::string::npos);
    EXPECT_TRUE(runner_->encodeCalls().empty());
}

TEST_F(VariantEncoderTest, ProcessFailureKeepsStderrTail)
{
    runner_->setEncodeHandler([](const std::vector<std::string> &)
                              {
        ProcessResult result;
        result.launched = true;
        result.exit_code = 1;
        result.error_message = "ffmpeg exited with code 1";
        result.stderr_text = "Stream mapping:\n  Stream #0:0 -> #0:0 (h264 -> h264_nvenc)\n"
                             "[h264_nvenc] OpenEncodeSessionEx failed: out of memory\nConversion failed!\n";
        return result; });

    std::string output = pathInTestDir("out.mp4");
    EncodeResult result = makeEncoder()->encode(source_, sampleSpec(), EncoderBackend::fromEncoderName("h264_nvenc"), output);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::EncodeProcessFailed);
    EXPECT_NE(result.error_message.find("Conversion failed!"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(VariantEncoderTest, TimeoutIsEncodeProcessFailure)
{
    runner_->setEncodeHandler([](const std::vector<std::string> &)
                              {
        ProcessResult result;
        result.launched = true;
        result.timed_out = true;
        result.exit_code = 9;
        result.error_message = "ffmpeg timed out after 42s";
        return result; });

    EncodeResult result = makeEncoder()->encode(source_, sampleSpec(), EncoderBackend::fromEncoderName("libx264"),
                                                pathInTestDir("out.mp4"));
    EXPECT_EQ(result.error_kind, ErrorKind::EncodeProcessFailed);
    EXPECT_NE(result.error_message.find("timed out"), std::string::npos);
}

TEST_F(VariantEncoderTest, ResolutionChangeFailsValidation)
{
    MediaInfo info = prober_->info();
    info.width = 1272;
    prober_->setInfo(info);

    std::string output = pathInTestDir("out.mp4");
    EncodeResult result = makeEncoder()->encode(source_, sampleSpec(), EncoderBackend::fromEncoderName("libx264"), output);
    EXPECT_EQ(result.error_kind, ErrorKind::OutputValidationFailed);
    EXPECT_NE(result.error_message.find("resolution"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(VariantEncoderTest, DurationOutsideToleranceFailsValidation)
{
    MediaInfo info = prober_->info();
    info.duration_seconds = 12.0;
    prober_->setInfo(info);

    EncodeResult result = makeEncoder()->encode(source_, sampleSpec(), EncoderBackend::fromEncoderName("libx264"),
                                                pathInTestDir("out.mp4"));
    EXPECT_EQ(result.error_kind, ErrorKind::OutputValidationFailed);
    EXPECT_NE(result.error_message.find("duration"), std::string::npos);
}

TEST_F(VariantEncoderTest, DurationScaledBySpeedIsAccepted)
{
    MediaInfo info = prober_->info();
    info.duration_seconds = 10.0 / 1.01;
    prober_->setInfo(info);

    EncodeResult result = makeEncoder()->encode(source_, sampleSpec(), EncoderBackend::fromEncoderName("libx264"),
                                                pathInTestDir("out.mp4"));
    EXPECT_TRUE(result.success) << result.error_message;
}

TEST_F(VariantEncoderTest, LeftoverMetadataFailsValidation)
{
    MediaInfo info = prober_->info();
    info.tags["encoder"] = "Lavf58.76.100";
    prober_->setInfo(info);

    EncodeResult result = makeEncoder()->encode(source_, sampleSpec(), EncoderBackend::fromEncoderName("libx264"),
                                                pathInTestDir("out.mp4"));
    EXPECT_EQ(result.error_kind, ErrorKind::OutputValidationFailed);
    EXPECT_NE(result.error_message.find("encoder"), std::string::npos);
}

TEST_F(VariantEncoderTest, UndecodableOutputFailsValidation)
{
    MediaInfo info = prober_->info();
    info.video_decodable = false;
    info.error_message = "Invalid data found when processing input";
    prober_->setInfo(info);

    EncodeResult result = makeEncoder()->encode(source_, sampleSpec(), EncoderBackend::fromEncoderName("libx264"),
                                                pathInTestDir("out.mp4"));
    EXPECT_EQ(result.error_kind, ErrorKind::OutputValidationFailed);
    EXPECT_NE(result.error_message.find("decode"), std::string::npos);
}

TEST_F(VariantEncoderTest, SessionLimitSerializesEncodes)
{
    runner_->setEncodeDelay(std::chrono::milliseconds(40));
    auto encoder = makeEncoder(1);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i)
    {
        threads.emplace_back([&, i]()
                             {
            TransformSpec spec = sampleSpec();
            spec.noise_seed = static_cast<uint32_t>(i);
            EncodeResult result = encoder->encode(source_, spec, EncoderBackend::fromEncoderName("h264_nvenc"),
                                                  pathInTestDir("out_" + std::to_string(i) + ".mp4"));
            EXPECT_TRUE(result.success) << result.error_message; });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(runner_->maxConcurrentEncodes(), 1);
    EXPECT_EQ(runner_->encodeCalls().size(), 4u);
}
