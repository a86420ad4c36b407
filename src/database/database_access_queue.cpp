#include "database/database_access_queue.hpp"
#include "database/metadata_store.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

DatabaseAccessQueue::DatabaseAccessQueue(MetadataStore &store)
    : store_(store)
{
    access_thread_ = std::thread(&DatabaseAccessQueue::access_thread_worker, this);
}

DatabaseAccessQueue::~DatabaseAccessQueue()
{
    stop();
    if (access_thread_.joinable())
    {
        access_thread_.join();
    }
}

std::future<WriteOperationResult> DatabaseAccessQueue::enqueueWrite(WriteOperation operation)
{
    std::promise<WriteOperationResult> promise;
    std::future<WriteOperationResult> future = promise.get_future();

    if (should_stop_)
    {
        promise.set_value(WriteOperationResult::Failure("Database access queue stopped"));
        return future;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        operation_queue_.push(QueuedWrite(std::move(operation), std::move(promise)));
    }
    queue_cv_.notify_one();
    return future;
}

std::future<std::any> DatabaseAccessQueue::enqueueRead(ReadOperation operation)
{
    std::promise<std::any> promise;
    std::future<std::any> future = promise.get_future();

    if (should_stop_)
    {
        promise.set_exception(std::make_exception_ptr(std::runtime_error("Database access queue stopped")));
        return future;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        operation_queue_.push(QueuedRead(std::move(operation), std::move(promise)));
    }
    queue_cv_.notify_one();
    return future;
}

void DatabaseAccessQueue::wait_for_completion()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]
                  { return (operation_queue_.empty() && !executing_) || worker_exited_; });
}

void DatabaseAccessQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        should_stop_ = true;
    }
    queue_cv_.notify_all();
}

void DatabaseAccessQueue::access_thread_worker()
{
    while (true)
    {
        std::variant<QueuedWrite, QueuedRead> operation;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !operation_queue_.empty() || should_stop_; });

            if (operation_queue_.empty())
            {
                // Stopped and drained
                break;
            }

            operation = std::move(operation_queue_.front());
            operation_queue_.pop();
            executing_ = true;
        }

        if (std::holds_alternative<QueuedWrite>(operation))
        {
            auto &[write_op, promise] = std::get<QueuedWrite>(operation);
            try
            {
                promise.set_value(write_op(store_));
            }
            catch (const std::exception &e)
            {
                Logger::error("Database write operation failed: " + std::string(e.what()));
                promise.set_value(WriteOperationResult::Failure(e.what()));
            }
        }
        else
        {
            auto &[read_op, promise] = std::get<QueuedRead>(operation);
            try
            {
                promise.set_value(read_op(store_));
            }
            catch (const std::exception &e)
            {
                Logger::error("Database read operation failed: " + std::string(e.what()));
                promise.set_exception(std::current_exception());
            }
        }
        completed_operations_.fetch_add(1);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            executing_ = false;
        }
        idle_cv_.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        worker_exited_ = true;
    }
    idle_cv_.notify_all();
}
