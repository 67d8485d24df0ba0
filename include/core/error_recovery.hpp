#pragma once
#include <algorithm>
#include <chrono>
#include <string>
#include <libavutil/error.h>
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    /**
     * @brief Exponential backoff delay before retry number @p attempt
     * @param attempt 1 for the delay after the first failure, 2 after the second...
     * @param base_ms Delay after the first failure
     * @param max_ms Upper bound on any single delay
     */
    static std::chrono::milliseconds backoffDelay(int attempt, int base_ms, int max_ms)
    {
        if (attempt < 1 || base_ms <= 0)
            return std::chrono::milliseconds(0);

        long long delay = base_ms;
        for (int i = 1; i < attempt && delay < max_ms; ++i)
        {
            delay *= 2;
        }
        return std::chrono::milliseconds(std::min<long long>(delay, max_ms));
    }

    // Translate an FFmpeg error code into a readable message
    static std::string avErrorString(int error_code)
    {
        char err_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
        if (av_strerror(error_code, err_buf, AV_ERROR_MAX_STRING_SIZE) < 0)
        {
            return "FFmpeg error " + std::to_string(error_code);
        }
        return std::string(err_buf) + " (error code: " + std::to_string(error_code) + ")";
    }

    // Graceful degradation: run the fallback when the primary throws
    template <typename Func, typename FallbackFunc, typename... Args>
    static auto callWithFallback(Func primary_func, FallbackFunc fallback_func,
                                 const std::string &operation_name, Args &&...args)
        -> decltype(primary_func(std::forward<Args>(args)...))
    {
        try
        {
            return primary_func(std::forward<Args>(args)...);
        }
        catch (const std::exception &e)
        {
            Logger::warn("Primary operation '" + operation_name + "' failed, using fallback: " + e.what());
            try
            {
                return fallback_func(std::forward<Args>(args)...);
            }
            catch (const std::exception &fallback_e)
            {
                Logger::error("Both primary and fallback operations failed for '" + operation_name +
                              "': " + fallback_e.what());
                throw;
            }
        }
    }
};
