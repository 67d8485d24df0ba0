#include "core/process_runner.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <Poco/StreamCopier.h>
#include <memory>
#include <thread>

namespace
{
    // Drain a pipe on a separate thread so a chatty child never blocks on a full buffer
    std::thread startReader(Poco::Pipe &pipe, std::string &sink)
    {
        return std::thread([&pipe, &sink]()
                           {
            try
            {
                Poco::PipeInputStream in(pipe);
                Poco::StreamCopier::copyToString(in, sink);
            }
            catch (const Poco::Exception &e)
            {
                Logger::warn("Error reading child process output: " + e.displayText());
            } });
    }
}

ProcessResult PocoProcessRunner::run(const std::string &command,
                                     const std::vector<std::string> &args,
                                     std::chrono::seconds timeout)
{
    ProcessResult result;
    Logger::debug("Launching: " + formatCommandLine(command, args));

    Poco::Pipe out_pipe;
    Poco::Pipe err_pipe;
    Poco::Process::Args poco_args(args.begin(), args.end());

    std::unique_ptr<Poco::ProcessHandle> handle;
    try
    {
        handle = std::make_unique<Poco::ProcessHandle>(
            Poco::Process::launch(command, poco_args, nullptr, &out_pipe, &err_pipe));
    }
    catch (const Poco::Exception &e)
    {
        result.error_message = "Failed to launch " + command + ": " + e.displayText();
        Logger::error(result.error_message);
        return result;
    }
    result.launched = true;

    // The parent keeps no write ends open, so readers see EOF when the child exits
    out_pipe.close(Poco::Pipe::CLOSE_WRITE);
    err_pipe.close(Poco::Pipe::CLOSE_WRITE);

    std::thread out_reader = startReader(out_pipe, result.stdout_text);
    std::thread err_reader = startReader(err_pipe, result.stderr_text);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (Poco::Process::isRunning(*handle))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            result.timed_out = true;
            Logger::warn("Process " + command + " (pid " + std::to_string(handle->id()) +
                         ") exceeded " + std::to_string(timeout.count()) + "s, killing");
            try
            {
                Poco::Process::kill(*handle);
            }
            catch (const Poco::Exception &e)
            {
                Logger::error("Failed to kill pid " + std::to_string(handle->id()) + ": " + e.displayText());
            }
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    try
    {
        result.exit_code = handle->wait();
    }
    catch (const Poco::Exception &e)
    {
        result.error_message = "Failed to wait for " + command + ": " + e.displayText();
        Logger::error(result.error_message);
    }

    out_reader.join();
    err_reader.join();

    if (result.timed_out)
    {
        result.error_message = command + " timed out after " + std::to_string(timeout.count()) + "s";
    }
    else if (result.exit_code != 0 && result.error_message.empty())
    {
        result.error_message = command + " exited with code " + std::to_string(result.exit_code);
    }
    return result;
}

std::string PocoProcessRunner::formatCommandLine(const std::string &command, const std::vector<std::string> &args)
{
    std::string line = command;
    for (const auto &arg : args)
    {
        line += " ";
        if (arg.find(' ') != std::string::npos || arg.empty())
            line += "\"" + arg + "\"";
        else
            line += arg;
    }
    return line;
}
