#pragma once

#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include <cstddef>
#include <functional>
#include <memory>

/**
 * @brief Bounded TBB worker pool for one pipeline stage
 *
 * Wraps a task_arena whose slot count is the stage's concurrency ceiling. The
 * pool also raises TBB's global parallelism limit while it is alive so the
 * ceiling is reachable on machines with fewer cores than blocking jobs.
 */
class DispatchPool
{
public:
    /**
     * @brief Create the pool
     * @param num_threads Concurrency ceiling, validated to [1, 64]; invalid values fall back to 4
     */
    explicit DispatchPool(size_t num_threads);

    DispatchPool(const DispatchPool &) = delete;
    DispatchPool &operator=(const DispatchPool &) = delete;

    /**
     * @brief Fire-and-forget submission; the task runs on an arena worker
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Run body(i) for i in [0, count) inside the arena and wait for all of them
     */
    void parallelFor(size_t count, const std::function<void(size_t)> &body);

    size_t concurrency() const { return thread_count_; }

    static bool validateThreadCount(size_t thread_count);

private:
    size_t thread_count_;
    std::unique_ptr<tbb::global_control> global_control_;
    std::unique_ptr<tbb::task_arena> arena_;
};
