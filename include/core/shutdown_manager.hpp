#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include "core/cancellation.hpp"

/**
 * Process-wide shutdown coordination for the CLI.
 * - Async-signal-safe handlers for SIGINT/SIGTERM/SIGQUIT only set flags
 * - A watcher thread turns those flags into a shutdown request
 * - A shutdown request cancels every registered batch; in-flight work finishes
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Programmatically request shutdown (safe from any thread, not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    /**
     * @brief Cancel @p source when shutdown is requested
     * @return Registration id for unregisterCancellation(); the source is
     *         cancelled immediately if shutdown was already requested
     */
    int registerCancellation(const CancellationSource &source);
    void unregisterCancellation(int id);

    // Block until shutdown has been requested
    void waitForShutdown();

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    std::map<int, CancellationSource> cancellations_;
    int next_registration_id_ = 1;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    // Async-signal-safe flags
    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
