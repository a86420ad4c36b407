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

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
    }

    if (signal_number != 0)
    {
        Logger::info("Received signal " + std::to_string(signal_number) + ", shutting down");
    }
    else
    {
        Logger::info("Shutdown requested: " + reason);
    }

    runCallbacks();
    cv_.notify_all();
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

int ShutdownManager::addCallback(Callback callback)
{
    int id;
    {
        std::lock_guard<std::mutex> lk(callbacks_mutex_);
        id = next_callback_id_++;
        if (!shutdown_requested_.load())
        {
            callbacks_[id] = std::move(callback);
            return id;
        }
    }
    callback();
    return id;
}

void ShutdownManager::removeCallback(int id)
{
    std::lock_guard<std::mutex> lk(callbacks_mutex_);
    callbacks_.erase(id);
}

void ShutdownManager::runCallbacks() noexcept
{
    std::vector<Callback> pending;
    {
        std::lock_guard<std::mutex> lk(callbacks_mutex_);
        for (auto &entry : callbacks_)
        {
            pending.push_back(std::move(entry.second));
        }
        callbacks_.clear();
    }

    for (auto &callback : pending)
    {
        try
        {
            callback();
        }
        catch (const std::exception &e)
        {
            Logger::error(std::string("Shutdown callback failed: ") + e.what());
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

    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_.clear();
    }
    {
        std::lock_guard<std::mutex> lk(callbacks_mutex_);
        callbacks_.clear();
    }
}
