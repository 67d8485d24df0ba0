#include "core/uniqueization_engine.hpp"
#include "core/dispatch_pool.hpp"
#include "core/error_recovery.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <optional>

UniqueizationEngine::UniqueizationEngine(TransformSelector selector,
                                         std::shared_ptr<VariantEncoder> encoder,
                                         std::shared_ptr<EncoderCapability> capability,
                                         std::shared_ptr<MediaStorage> storage,
                                         UniqueizationConfig config,
                                         int max_sessions)
    : selector_(std::move(selector)), encoder_(std::move(encoder)), capability_(std::move(capability)),
      storage_(std::move(storage)), config_(config), max_sessions_(max_sessions < 1 ? 1 : max_sessions)
{
}

UniqueizationResult UniqueizationEngine::uniqueize(const SourceMedia &source,
                                                   const std::vector<AccountTarget> &targets,
                                                   const std::string &seed,
                                                   const std::string &work_dir,
                                                   const CancellationToken &token)
{
    {
        std::lock_guard<std::mutex> lock(checksum_mutex_);
        seen_checksums_.clear();
    }

    std::vector<TargetOutcome> outcomes(targets.size());
    DispatchPool pool(static_cast<size_t>(max_sessions_));
    pool.parallelFor(targets.size(), [&](size_t i)
                     {
        try
        {
            outcomes[i] = processTarget(source, targets[i], seed, work_dir, token);
        }
        catch (const std::exception &e)
        {
            Logger::error("Uniqueization of " + targets[i].key() + " aborted: " + e.what());
            outcomes[i].success = false;
            outcomes[i].failure = {targets[i], ErrorKind::UniqueizationFailed,
                                   errorKindName(ErrorKind::UniqueizationFailed) + ": " + e.what()};
        } });

    UniqueizationResult result;
    for (size_t i = 0; i < targets.size(); ++i)
    {
        if (outcomes[i].success)
        {
            result.work_files.push_back(outcomes[i].variant.file_path);
            result.variants.push_back({targets[i], outcomes[i].variant});
        }
        else
        {
            result.failures.push_back(outcomes[i].failure);
        }
    }

    Logger::info("Uniqueization finished: " + std::to_string(result.variants.size()) + " variants, " +
                 std::to_string(result.failures.size()) + " failures");
    return result;
}

UniqueizationEngine::TargetOutcome UniqueizationEngine::processTarget(const SourceMedia &source,
                                                                      const AccountTarget &target,
                                                                      const std::string &seed,
                                                                      const std::string &work_dir,
                                                                      const CancellationToken &token)
{
    TargetOutcome outcome;
    outcome.failure.target = target;

    if (token.isCancelled())
    {
        outcome.failure.kind = ErrorKind::Cancelled;
        outcome.failure.reason = errorKindName(ErrorKind::Cancelled);
        return outcome;
    }

    std::optional<EncoderBackend> backend = capability_->primary();
    if (!backend)
    {
        outcome.failure.kind = ErrorKind::UniqueizationFailed;
        outcome.failure.reason = errorKindName(ErrorKind::UniqueizationFailed) + ": " +
                                 errorKindName(ErrorKind::NoEncoderAvailable);
        return outcome;
    }

    const std::string salt = target.key();
    ErrorKind last_kind = ErrorKind::None;
    std::string last_error;

    for (int attempt = 1; attempt <= config_.max_attempts; ++attempt)
    {
        if (attempt > 1 && token.isCancelled())
        {
            last_error += " (retries stopped by cancellation)";
            break;
        }

        // A retry draws a fresh spec; the first attempt uses the plain account salt
        std::string attempt_salt = attempt == 1 ? salt : salt + "#retry" + std::to_string(attempt - 1);
        TransformSpec spec = selector_.select(seed, attempt_salt);
        std::string output_path = (fs::path(work_dir) / outputFileName(target, attempt)).string();

        EncodeResult encoded = encodeWithFallback(source, spec, *backend, output_path);
        if (!encoded.success)
        {
            last_kind = encoded.error_kind;
            last_error = encoded.error_message;
            Logger::warn("Attempt " + std::to_string(attempt) + "/" + std::to_string(config_.max_attempts) +
                         " for " + salt + " failed: " + errorKindName(last_kind) + ": " + last_error);
            continue;
        }

        if (!claimChecksum(encoded.variant.checksum, source.checksum))
        {
            last_kind = ErrorKind::OutputValidationFailed;
            last_error = "checksum " + encoded.variant.checksum.substr(0, 16) +
                         " collides with the source or another variant";
            Logger::warn("Attempt " + std::to_string(attempt) + " for " + salt + ": " + last_error);
            FileUtils::removeFile(encoded.variant.file_path);
            continue;
        }

        try
        {
            encoded.variant.handle = storage_->store(encoded.variant.file_path);
        }
        catch (const StorageError &e)
        {
            Logger::error("Storing variant for " + salt + " failed: " + e.what());
            FileUtils::removeFile(encoded.variant.file_path);
            outcome.failure.kind = ErrorKind::UniqueizationFailed;
            outcome.failure.reason = errorKindName(ErrorKind::UniqueizationFailed) + ": storage: " + e.what();
            return outcome;
        }

        outcome.success = true;
        outcome.variant = encoded.variant;
        return outcome;
    }

    outcome.failure.kind = ErrorKind::UniqueizationFailed;
    outcome.failure.reason = errorKindName(ErrorKind::UniqueizationFailed) + ": " + errorKindName(last_kind) +
                             ": " + last_error;
    Logger::error("Giving up on " + salt + " after " + std::to_string(config_.max_attempts) + " attempts");
    return outcome;
}

EncodeResult UniqueizationEngine::encodeWithFallback(const SourceMedia &source, const TransformSpec &spec,
                                                     const EncoderBackend &backend, const std::string &output_path)
{
    std::optional<EncoderBackend> fallback = capability_->softwareFallback();
    if (!backend.isHardware() || !fallback)
    {
        return encoder_->encode(source, spec, backend, output_path);
    }

    try
    {
        return ErrorRecovery::callWithFallback(
            [&]()
            {
                EncodeResult result = encoder_->encode(source, spec, backend, output_path);
                if (!result.success && result.error_kind == ErrorKind::EncodeProcessFailed)
                    throw PipelineError(result.error_kind, result.error_message);
                return result;
            },
            [&]()
            { return encoder_->encode(source, spec, *fallback, output_path); },
            "encode " + spec.salt + " on " + backend.encoder_name);
    }
    catch (const std::exception &e)
    {
        return EncodeResult::failure(ErrorKind::EncodeProcessFailed, e.what());
    }
}

bool UniqueizationEngine::claimChecksum(const std::string &checksum, const std::string &source_checksum)
{
    if (checksum == source_checksum)
        return false;
    std::lock_guard<std::mutex> lock(checksum_mutex_);
    return seen_checksums_.insert(checksum).second;
}

std::string UniqueizationEngine::outputFileName(const AccountTarget &target, int attempt)
{
    return platformCode(target.platform) + "_" + target.account_id + "_" + std::to_string(attempt) + ".mp4";
}
