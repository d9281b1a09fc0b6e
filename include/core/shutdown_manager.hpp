#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Process-wide cancellation source.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM/SIGQUIT
 * - A watcher thread turns the signal flag into a shutdown request
 * - Registered callbacks run once, on the thread that requested shutdown
 */
class ShutdownManager
{
public:
    using Callback = std::function<void()>;

    static ShutdownManager &getInstance();

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Runs immediately if shutdown was already requested
    void registerCallback(Callback callback);

    // Programmatically request shutdown (safe to call from any thread, not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Stop the watcher and clear state and callbacks (tests, end of run)
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    std::vector<Callback> callbacks_;
    mutable std::mutex mutex_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
