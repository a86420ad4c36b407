#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

/**
 * Process-wide shutdown coordination for the command-line front end.
 * - SIGINT/SIGTERM handlers only set a sig_atomic_t flag
 * - A watcher thread turns the flag into requestShutdown()
 * - Registered callbacks (e.g. cancelling a running scan) run once, on the
 *   thread that requested shutdown
 */
class ShutdownManager
{
public:
    using Callback = std::function<void()>;

    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Safe from any thread except a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Block until shutdown has been requested
    void waitForShutdown();

    /**
     * @brief Register work to run when shutdown is requested. If shutdown
     * was already requested the callback runs immediately.
     * @return Id for removeCallback
     */
    int addCallback(Callback callback);
    void removeCallback(int id);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Clears state and callbacks, for tests
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();
    void runCallbacks() noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::mutex callbacks_mutex_;
    std::map<int, Callback> callbacks_;
    int next_callback_id_ = 1;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
