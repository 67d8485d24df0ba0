#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error taxonomy shared by the uniqueization and publish stages
 *
 * Per-target and per-account kinds are carried inside result structs and end up
 * in the batch report. Only ValidationError and NoEncoderAvailable abort a batch,
 * and those are thrown as exceptions before any work starts.
 */
enum class ErrorKind
{
    None,
    ValidationError,
    UniqueizationFailed,
    NoEncoderAvailable,
    EncodeProcessFailed,
    OutputValidationFailed,
    PublishTransientError,
    PublishRejected,
    Cancelled
};

inline std::string errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "None";
    case ErrorKind::ValidationError:
        return "ValidationError";
    case ErrorKind::UniqueizationFailed:
        return "UniqueizationFailed";
    case ErrorKind::NoEncoderAvailable:
        return "NoEncoderAvailable";
    case ErrorKind::EncodeProcessFailed:
        return "EncodeProcessFailed";
    case ErrorKind::OutputValidationFailed:
        return "OutputValidationFailed";
    case ErrorKind::PublishTransientError:
        return "PublishTransientError";
    case ErrorKind::PublishRejected:
        return "PublishRejected";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

class PipelineError : public std::runtime_error
{
public:
    PipelineError(ErrorKind kind, const std::string &message)
        : std::runtime_error(errorKindName(kind) + ": " + message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad input shape, past schedule, empty target set. Nothing has been encoded or sent.
class ValidationError : public PipelineError
{
public:
    explicit ValidationError(const std::string &message)
        : PipelineError(ErrorKind::ValidationError, message) {}
};

// Neither a hardware encoder nor a permitted software encoder could be probed.
class NoEncoderAvailableError : public PipelineError
{
public:
    explicit NoEncoderAvailableError(const std::string &message)
        : PipelineError(ErrorKind::NoEncoderAvailable, message) {}
};
