#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <csignal>
#include <unistd.h>

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
    signal(SIGINT, &ShutdownManager::handleSignal);
    signal(SIGTERM, &ShutdownManager::handleSignal);
    signal(SIGQUIT, &ShutdownManager::handleSignal);

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
                requestShutdown("Signal received", sig);
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

void ShutdownManager::registerCallback(Callback callback)
{
    if (!callback)
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!shutdown_requested_.load())
        {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
        callbacks.swap(callbacks_);
    }

    if (signal_number != 0)
    {
        Logger::warn("ShutdownManager: received signal " + std::to_string(signal_number) + ", stopping after files in flight");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }

    for (auto &callback : callbacks)
    {
        try
        {
            callback();
        }
        catch (const std::exception &e)
        {
            Logger::error(std::string("ShutdownManager: callback failed: ") + e.what());
        }
    }
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
    callbacks_.clear();
}
