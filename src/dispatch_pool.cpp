#include "core/dispatch_pool.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

DispatchPool::DispatchPool(size_t num_threads)
{
    if (validateThreadCount(num_threads))
    {
        thread_count_ = num_threads;
    }
    else
    {
        Logger::error("Invalid thread count: " + std::to_string(num_threads) + ". Using default: 4");
        thread_count_ = 4;
    }

    // One extra slot for the thread that waits on the stage
    global_control_ = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, thread_count_ + 1);
    arena_ = std::make_unique<tbb::task_arena>(static_cast<int>(thread_count_), 0);
    Logger::debug("Dispatch pool initialized with " + std::to_string(thread_count_) + " threads");
}

void DispatchPool::enqueue(std::function<void()> task)
{
    arena_->enqueue(std::move(task));
}

void DispatchPool::parallelFor(size_t count, const std::function<void(size_t)> &body)
{
    if (count == 0)
        return;
    arena_->execute([&]()
                    { tbb::parallel_for(tbb::blocked_range<size_t>(0, count, 1),
                                        [&](const tbb::blocked_range<size_t> &range)
                                        {
                                            for (size_t i = range.begin(); i != range.end(); ++i)
                                            {
                                                body(i);
                                            }
                                        }); });
}

bool DispatchPool::validateThreadCount(size_t thread_count)
{
    return thread_count >= 1 && thread_count <= 64;
}
