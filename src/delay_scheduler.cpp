#include "core/delay_scheduler.hpp"
#include "logging/logger.hpp"
#include <vector>

DelayScheduler::DelayScheduler() : worker_([this]()
                                           { run(); })
{
}

DelayScheduler::~DelayScheduler()
{
    stop();
}

void DelayScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> callback)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.emplace(Clock::now() + delay, std::move(callback));
    }
    cv_.notify_one();
}

void DelayScheduler::flush()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty())
            return;
        flush_requested_ = true;
    }
    cv_.notify_one();
}

void DelayScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable())
            return;
        stopping_ = true;
    }
    cv_.notify_one();
    if (worker_.joinable())
        worker_.join();
}

size_t DelayScheduler::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void DelayScheduler::run()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        if (queue_.empty())
        {
            if (stopping_)
                return;
            cv_.wait(lock, [this]()
                     { return stopping_ || !queue_.empty(); });
            continue;
        }

        bool run_all = flush_requested_ || stopping_;
        auto now = Clock::now();
        if (!run_all && queue_.begin()->first > now)
        {
            auto due = queue_.begin()->first;
            cv_.wait_until(lock, due, [this, due]()
                           { return stopping_ || flush_requested_ || queue_.begin()->first < due; });
            continue;
        }

        std::vector<std::function<void()>> ready;
        auto end = run_all ? queue_.end() : queue_.upper_bound(now);
        for (auto it = queue_.begin(); it != end; ++it)
            ready.push_back(std::move(it->second));
        queue_.erase(queue_.begin(), end);
        flush_requested_ = false;

        lock.unlock();
        for (auto &callback : ready)
        {
            try
            {
                callback();
            }
            catch (const std::exception &e)
            {
                Logger::error(std::string("Delayed callback failed: ") + e.what());
            }
        }
        lock.lock();
    }
}
