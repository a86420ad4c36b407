#pragma once

#include <future>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <any>
#include <atomic>
#include <chrono>
#include <string>
#include <variant>

class MetadataStore;

struct WriteOperationResult
{
    bool success;
    std::string error_message;
    int rows_affected;

    WriteOperationResult(bool s = true, const std::string &msg = "", int rows = 0)
        : success(s), error_message(msg), rows_affected(rows) {}

    static WriteOperationResult Success(int rows = 0)
    {
        return WriteOperationResult(true, "", rows);
    }

    static WriteOperationResult Failure(const std::string &msg = "")
    {
        return WriteOperationResult(false, msg);
    }
};

using WriteOperation = std::function<WriteOperationResult(MetadataStore &)>;
using ReadOperation = std::function<std::any(MetadataStore &)>;

/**
 * @brief Serializes every statement against the store's sqlite handle on
 * one dedicated access thread. Callers on any thread enqueue work and wait
 * on the returned future.
 */
class DatabaseAccessQueue
{
public:
    explicit DatabaseAccessQueue(MetadataStore &store);
    ~DatabaseAccessQueue();

    std::future<WriteOperationResult> enqueueWrite(WriteOperation operation);
    std::future<std::any> enqueueRead(ReadOperation operation);

    // Block until the queue is empty and nothing is executing
    void wait_for_completion();

    // Stop accepting work; queued operations still run before the thread exits
    void stop();

    size_t getCompletedOperationCount() const { return completed_operations_.load(); }

private:
    using QueuedWrite = std::pair<WriteOperation, std::promise<WriteOperationResult>>;
    using QueuedRead = std::pair<ReadOperation, std::promise<std::any>>;

    void access_thread_worker();

    MetadataStore &store_;
    std::queue<std::variant<QueuedWrite, QueuedRead>> operation_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::thread access_thread_;
    std::atomic<bool> should_stop_{false};
    bool executing_ = false;
    bool worker_exited_ = false;
    std::atomic<size_t> completed_operations_{0};
};
