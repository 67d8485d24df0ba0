#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

// Counts terminal jobs down to zero; waiters wake once every job has finished
class CompletionLatch
{
public:
    explicit CompletionLatch(size_t count) : remaining_(count) {}

    void countDown()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (remaining_ > 0)
            --remaining_;
        // Notify under the lock so the waiter cannot destroy us mid-notify
        if (remaining_ == 0)
            cv_.notify_all();
    }

    bool waitFor(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]()
                            { return remaining_ == 0; });
    }

    size_t remaining() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return remaining_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t remaining_;
};
