#pragma once

#include <chrono>
#include <string>
#include <vector>

/**
 * @brief Outcome of one child process run
 */
struct ProcessResult
{
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;

    bool succeeded() const { return launched && !timed_out && exit_code == 0; }
};

/**
 * @brief Runs an external command to completion
 *
 * Implementations must kill the child when the timeout expires and report
 * timed_out instead of blocking past the deadline.
 */
class ProcessRunner
{
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const std::string &command,
                              const std::vector<std::string> &args,
                              std::chrono::seconds timeout) = 0;
};

/**
 * @brief ProcessRunner backed by Poco::Process with piped stdout/stderr
 */
class PocoProcessRunner : public ProcessRunner
{
public:
    ProcessResult run(const std::string &command,
                      const std::vector<std::string> &args,
                      std::chrono::seconds timeout) override;

    /**
     * @brief Render a command line for logs (arguments with spaces are quoted)
     */
    static std::string formatCommandLine(const std::string &command, const std::vector<std::string> &args);

private:
    static constexpr std::chrono::milliseconds kPollInterval{50};
};
