#include "core/batch_pipeline.hpp"
#include "core/file_utils.hpp"
#include "core/poco_config_manager.hpp"
#include "core/publish_orchestrator.hpp"
#include "core/schedule_time.hpp"
#include "core/uniqueization_engine.hpp"
#include "logging/logger.hpp"
#include <random>
#include <set>
#include <system_error>

namespace
{
    // Removes the batch work directory however run() exits
    class WorkDirCleanup
    {
    public:
        explicit WorkDirCleanup(std::string dir) : dir_(std::move(dir)) {}
        ~WorkDirCleanup()
        {
            std::error_code ec;
            fs::remove_all(dir_, ec);
            if (ec)
                Logger::warn("Failed to clean work directory " + dir_ + ": " + ec.message());
            else
                Logger::debug("Removed work directory " + dir_);
        }

        WorkDirCleanup(const WorkDirCleanup &) = delete;
        WorkDirCleanup &operator=(const WorkDirCleanup &) = delete;

    private:
        std::string dir_;
    };
}

PipelineSettings PipelineSettings::fromConfig(const PocoConfigManager &config)
{
    PipelineSettings settings;
    settings.encoder = config.getEncoderConfig();
    settings.bounds = config.getTransformBounds();
    settings.uniqueization = config.getUniqueizationConfig();
    settings.publish = config.getPublishConfig();
    settings.provider = config.getProviderConfig();
    settings.schedule = config.getScheduleConfig();
    return settings;
}

BatchPipeline::BatchPipeline(std::shared_ptr<MediaProber> prober,
                             std::shared_ptr<EncoderCapability> capability,
                             std::shared_ptr<VariantEncoder> encoder,
                             std::shared_ptr<MediaStorage> storage,
                             std::shared_ptr<PublishingProvider> provider,
                             PipelineSettings settings)
    : prober_(std::move(prober)), capability_(std::move(capability)), encoder_(std::move(encoder)),
      storage_(std::move(storage)), provider_(std::move(provider)), settings_(std::move(settings)),
      clock_([]()
             { return ScheduleTime::now(); })
{
}

void BatchPipeline::validateTargets(const std::vector<AccountTarget> &targets)
{
    if (targets.empty())
        throw ValidationError("no target accounts selected");

    std::set<std::string> seen;
    for (const auto &target : targets)
    {
        if (!seen.insert(target.key()).second)
            throw ValidationError("duplicate target account " + target.key());
    }
}

std::string BatchPipeline::generateSeed()
{
    std::random_device device;
    uint64_t value = (static_cast<uint64_t>(device()) << 32) | device();
    return std::to_string(value);
}

SourceMedia BatchPipeline::loadSource(const std::string &path)
{
    if (!FileUtils::hasSupportedVideoExtension(path))
    {
        std::string supported;
        for (const auto &ext : FileUtils::supportedVideoExtensions())
            supported += (supported.empty() ? "" : ", ") + ext;
        throw ValidationError("unsupported video format " + fs::path(path).extension().string() +
                              " (supported: " + supported + ")");
    }
    if (!FileUtils::isNonEmptyFile(path))
        throw ValidationError("source video is missing or empty: " + path);

    MediaInfo info = prober_->probe(path, true);
    if (!info.opened)
        throw ValidationError("source video cannot be probed: " + info.error_message);
    if (!info.has_video || info.width <= 0 || info.height <= 0)
        throw ValidationError("source has no usable video stream: " + path);
    if (!info.video_decodable)
        throw ValidationError("source video does not decode: " + info.error_message);

    std::string checksum = FileUtils::computeFileHash(path);
    if (checksum.empty())
        throw ValidationError("cannot read source video: " + path);

    std::error_code ec;
    uint64_t size = fs::file_size(path, ec);
    return SourceMedia::fromProbe(path, info, ec ? 0 : size, checksum);
}

BatchResult BatchPipeline::run(const BatchRequest &request, const CancellationToken &token)
{
    // Everything that can reject the batch runs before the first encode
    validateTargets(request.targets);

    if (settings_.provider.api_token.find_first_not_of(" \t\r\n\"'") == std::string::npos)
        throw ValidationError("publishing provider token is not configured");

    int64_t scheduled_at = ScheduleTime::resolveFuture(request.scheduled_at,
                                                       settings_.schedule.utc_offset_minutes, clock_());
    SourceMedia source = loadSource(request.source_path);

    const CapabilityReport &capability = capability_->report();
    if (!capability.hasAny())
    {
        std::string detail = capability.probe_error.empty()
                                 ? "no preferred hardware encoder and no permitted software encoder"
                                 : capability.probe_error;
        throw NoEncoderAvailableError(detail);
    }

    std::string seed = request.seed.empty() ? generateSeed() : request.seed;
    Logger::info("Starting batch: " + std::to_string(request.targets.size()) + " accounts, source " +
                 source.path + " (" + std::to_string(source.width) + "x" + std::to_string(source.height) +
                 ", " + std::to_string(source.duration_seconds) + "s), scheduled " +
                 ScheduleTime::formatUtc(scheduled_at) + ", seed " + seed);

    std::string work_dir = (fs::path(settings_.encoder.work_dir) /
                            ("batch_" + FileUtils::toHex(FileUtils::sha256(seed + source.checksum).data(), 6)))
                               .string();
    if (!FileUtils::ensureDirectory(work_dir))
        throw ValidationError("encoder.work_dir is not writable: " + work_dir);
    WorkDirCleanup cleanup(work_dir);

    UniqueizationEngine engine(TransformSelector(settings_.bounds), encoder_, capability_, storage_,
                               settings_.uniqueization, settings_.encoder.max_sessions);
    UniqueizationResult variants = engine.uniqueize(source, request.targets, seed, work_dir, token);

    PublishOrchestrator orchestrator(provider_, settings_.publish);
    std::vector<JobOutcome> outcomes = orchestrator.dispatch(variants.variants, scheduled_at, request.caption, token);

    for (const auto &file : variants.work_files)
    {
        FileUtils::removeFile(file);
    }

    BatchResult result = BatchAggregator::aggregate(outcomes, variants.failures,
                                                    static_cast<int>(request.targets.size()));
    result.seed = seed;
    result.scheduled_at = scheduled_at;
    return result;
}
