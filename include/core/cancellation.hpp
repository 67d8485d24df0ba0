#pragma once

#include <atomic>
#include <memory>

/**
 * @brief Read side of a batch-scoped cancellation flag
 *
 * Copies share one flag. A default-constructed token is never cancelled.
 */
class CancellationToken
{
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    bool isCancelled() const { return flag_->load(); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource
{
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }
    CancellationToken token() const { return CancellationToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
