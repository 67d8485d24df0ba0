#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <vector>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    std::signal(SIGINT, &ShutdownManager::handleSignal);
    std::signal(SIGTERM, &ShutdownManager::handleSignal);
    std::signal(SIGQUIT, &ShutdownManager::handleSignal);

    startWatcher();
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("signal received", sig);
            }
            if (shutdown_requested_.load())
            {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

int ShutdownManager::registerCancellation(const CancellationSource &source)
{
    std::lock_guard<std::mutex> lk(mutex_);
    int id = next_registration_id_++;
    auto inserted = cancellations_.emplace(id, source).first;
    if (shutdown_requested_.load())
    {
        inserted->second.cancel();
    }
    return id;
}

void ShutdownManager::unregisterCancellation(int id)
{
    std::lock_guard<std::mutex> lk(mutex_);
    cancellations_.erase(id);
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    size_t cancelled = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
        for (auto &entry : cancellations_)
        {
            entry.second.cancel();
            ++cancelled;
        }
    }
    cv_.notify_all();
    watcher_running_.store(false);

    try
    {
        if (signal_number != 0)
        {
            Logger::warn("Received signal " + std::to_string(signal_number) + ", cancelling " +
                         std::to_string(cancelled) + " running batch(es); in-flight work will finish");
        }
        else
        {
            Logger::info("Shutdown requested (" + reason + "), cancelling " + std::to_string(cancelled) +
                         " running batch(es)");
        }
    }
    catch (const std::exception &e)
    {
        spdlog::error("ShutdownManager: failed to log shutdown: {}", e.what());
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);

    signal_flag_ = 0;
    signal_num_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    reason_.clear();
    cancellations_.clear();
}
