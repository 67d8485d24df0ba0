#pragma once

#include <condition_variable>
#include <mutex>

/**
 * @brief Counting gate limiting concurrent encoder sessions
 *
 * Consumer GPUs cap simultaneous NVENC sessions, so encodes queue here even
 * when more worker threads are free. A limit of 1 serializes all encodes.
 */
class SessionGate
{
public:
    explicit SessionGate(int max_sessions) : available_(max_sessions < 1 ? 1 : max_sessions) {}

    class Ticket
    {
    public:
        explicit Ticket(SessionGate &gate) : gate_(gate) { gate_.acquire(); }
        ~Ticket() { gate_.release(); }

        Ticket(const Ticket &) = delete;
        Ticket &operator=(const Ticket &) = delete;

    private:
        SessionGate &gate_;
    };

    int available() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

private:
    void acquire()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]()
                 { return available_ > 0; });
        --available_;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++available_;
        }
        cv_.notify_one();
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int available_;
};
