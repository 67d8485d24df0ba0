#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

/**
 * @brief Single timer thread that runs callbacks after a delay
 *
 * Callbacks should be short (typically an enqueue into a worker pool); they
 * run on the timer thread.
 */
class DelayScheduler
{
public:
    DelayScheduler();
    ~DelayScheduler();

    DelayScheduler(const DelayScheduler &) = delete;
    DelayScheduler &operator=(const DelayScheduler &) = delete;

    void schedule(std::chrono::milliseconds delay, std::function<void()> callback);

    /**
     * @brief Run every pending callback now instead of at its due time
     */
    void flush();

    /**
     * @brief Stop the timer thread; callbacks still pending are run first
     */
    void stop();

    size_t pending() const;

private:
    void run();

    using Clock = std::chrono::steady_clock;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<Clock::time_point, std::function<void()>> queue_;
    bool flush_requested_ = false;
    bool stopping_ = false;
    std::thread worker_;
};
