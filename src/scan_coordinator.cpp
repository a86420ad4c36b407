#include "core/scan_coordinator.hpp"
#include "core/file_utils.hpp"
#include "core/file_walker.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>

ScanCoordinator::ScanCoordinator(MetadataStore &store, ClassifierProvider classifier_provider, ScanOptions options)
    : store_(store), classifier_provider_(std::move(classifier_provider)), options_(options)
{
    if (!classifier_provider_)
    {
        classifier_provider_ = []
        { return MediaClassifier(); };
    }
    if (options_.progress_interval_ms < 0)
    {
        options_.progress_interval_ms = 0;
    }
}

ScanCoordinator::~ScanCoordinator()
{
    cancel();
    wait();
}

ScanStartResult ScanCoordinator::startScan(const std::string &root_path)
{
    if (onScanThread())
    {
        Logger::warn("startScan called from a scan observer, rejecting");
        return ScanStartResult::ALREADY_RUNNING;
    }

    ScanEvent failure;
    ScanStartResult result = beginScan(root_path, failure);

    // Published after control_mutex_ is released so an observer may retry
    if (result != ScanStartResult::STARTED && result != ScanStartResult::ALREADY_RUNNING)
    {
        publish(failure);
    }
    return result;
}

ScanStartResult ScanCoordinator::beginScan(const std::string &root_path, ScanEvent &failure)
{
    std::lock_guard<std::mutex> control_lock(control_mutex_);

    uint64_t session_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == ScanStatus::RUNNING || status_ == ScanStatus::CANCELLING)
        {
            Logger::warn("Scan requested for " + root_path + " while another scan is running");
            return ScanStartResult::ALREADY_RUNNING;
        }
        session_id = next_session_id_++;
    }

    // The previous session is terminal; reap its thread
    if (scan_thread_.joinable())
    {
        scan_thread_.join();
    }

    if (!store_.isOpen())
    {
        failure = failBeforeStart(session_id, root_path, scanStartResultToString(ScanStartResult::STORE_UNAVAILABLE));
        return ScanStartResult::STORE_UNAVAILABLE;
    }

    auto root_status = FileWalker::checkRoot(root_path);
    if (root_status != FileWalker::RootStatus::OK)
    {
        failure = failBeforeStart(session_id, root_path, FileWalker::rootStatusToString(root_status));
        switch (root_status)
        {
        case FileWalker::RootStatus::NOT_A_DIRECTORY:
            return ScanStartResult::NOT_A_DIRECTORY;
        case FileWalker::RootStatus::PERMISSION_DENIED:
            return ScanStartResult::PERMISSION_DENIED;
        case FileWalker::RootStatus::NOT_FOUND:
        default:
            return ScanStartResult::PATH_NOT_FOUND;
        }
    }

    MediaClassifier classifier = classifier_provider_();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = ScanStatus::RUNNING;
        current_target_ = root_path;
        last_error_.clear();
        summary_ = ScanSummary();
        summary_.session_id = session_id;
        summary_.root_path = root_path;
        summary_.status = ScanStatus::RUNNING;
        summary_.started_at = std::chrono::system_clock::now();
        cancel_requested_ = false;
        walk_exhausted_ = false;
    }

    Logger::info("Starting scan #" + std::to_string(session_id) + " of " + root_path);
    scan_thread_ = std::thread(&ScanCoordinator::runScan, this, session_id, root_path, std::move(classifier));
    return ScanStartResult::STARTED;
}

bool ScanCoordinator::cancel()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (status_ != ScanStatus::RUNNING || walk_exhausted_)
    {
        return false;
    }
    status_ = ScanStatus::CANCELLING;
    cancel_requested_ = true;
    Logger::info("Cancelling scan of " + summary_.root_path);
    return true;
}

void ScanCoordinator::wait()
{
    if (onScanThread())
    {
        return;
    }

    std::lock_guard<std::mutex> control_lock(control_mutex_);
    if (scan_thread_.joinable())
    {
        scan_thread_.join();
    }
}

ScanStatus ScanCoordinator::status() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

bool ScanCoordinator::isRunning() const
{
    auto current = status();
    return current == ScanStatus::RUNNING || current == ScanStatus::CANCELLING;
}

std::string ScanCoordinator::currentTarget() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_target_;
}

std::string ScanCoordinator::lastError() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

ScanSummary ScanCoordinator::lastSummary() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return summary_;
}

void ScanCoordinator::subscribe(ScanObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
    }
}

void ScanCoordinator::unsubscribe(ScanObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void ScanCoordinator::runScan(uint64_t session_id, std::string root_path, MediaClassifier classifier)
{
    scan_thread_id_ = std::this_thread::get_id();

    const auto interval = std::chrono::milliseconds(options_.progress_interval_ms);
    auto last_progress = std::chrono::steady_clock::now() - interval;

    ScanEvent progress;
    progress.session_id = session_id;

    try
    {
        FileWalker walker(root_path, std::move(classifier));
        bool exhausted = false;

        while (!cancel_requested_)
        {
            auto file = walker.next();
            if (!file)
            {
                exhausted = true;
                break;
            }

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                current_target_ = file->path;
            }

            DBOpResult result = store_.upsert(FileUtils::toMediaRecord(file->path, file->type));
            ++progress.files_processed;
            if (!result.success)
            {
                ++progress.files_failed;
                Logger::warn("Skipping " + file->path + ": " + result.error_message);
            }
            else
            {
                progress.files_inserted += static_cast<size_t>(result.rows_affected);
                Logger::debug((result.rows_affected > 0 ? "Indexed " : "Already indexed ") + file->path);
            }
            progress.path = file->path;

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                summary_.files_processed = progress.files_processed;
                summary_.files_inserted = progress.files_inserted;
                summary_.files_failed = progress.files_failed;
            }

            auto now = std::chrono::steady_clock::now();
            if (interval.count() == 0 || now - last_progress >= interval)
            {
                last_progress = now;
                publish(progress);
            }
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            summary_.walk_failures = walker.failures();
            // A finished walk completes even if cancel() raced its last step
            if (exhausted)
            {
                walk_exhausted_ = true;
                if (status_ == ScanStatus::CANCELLING)
                {
                    status_ = ScanStatus::RUNNING;
                }
            }
        }

        ScanEvent terminal = progress;
        if (!exhausted)
        {
            terminal.type = ScanEvent::Type::CANCELLED;
            terminal.message = "Scan cancelled after " + std::to_string(progress.files_processed) + " files";
            Logger::info(terminal.message);
            finish(ScanStatus::CANCELLED, terminal);
        }
        else
        {
            terminal.type = ScanEvent::Type::COMPLETED;
            terminal.message = "Scan complete. Found " + std::to_string(progress.files_inserted) + " new files.";
            Logger::info(terminal.message + " Scanned: " + std::to_string(progress.files_processed) +
                         ", failed: " + std::to_string(progress.files_failed) +
                         ", unreadable directories: " + std::to_string(walker.failures().size()));
            finish(ScanStatus::COMPLETED, terminal);
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("Scan of " + root_path + " aborted: " + e.what());
        ScanEvent terminal = progress;
        terminal.type = ScanEvent::Type::FAILED;
        terminal.message = e.what();
        finish(ScanStatus::FAILED, terminal);
    }

    scan_thread_id_ = std::thread::id();
}

ScanEvent ScanCoordinator::failBeforeStart(uint64_t session_id, const std::string &root_path, const std::string &reason)
{
    Logger::error("Cannot scan " + root_path + ": " + reason);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = ScanStatus::FAILED;
        current_target_.clear();
        last_error_ = reason;
        summary_ = ScanSummary();
        summary_.session_id = session_id;
        summary_.root_path = root_path;
        summary_.status = ScanStatus::FAILED;
        summary_.error_message = reason;
        summary_.started_at = std::chrono::system_clock::now();
        summary_.finished_at = summary_.started_at;
    }

    ScanEvent event;
    event.type = ScanEvent::Type::FAILED;
    event.session_id = session_id;
    event.path = root_path;
    event.message = reason;
    return event;
}

void ScanCoordinator::finish(ScanStatus final_status, const ScanEvent &terminal_event)
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = final_status;
        summary_.status = final_status;
        summary_.finished_at = std::chrono::system_clock::now();
        if (final_status == ScanStatus::FAILED)
        {
            last_error_ = terminal_event.message;
            summary_.error_message = terminal_event.message;
        }
    }
    publish(terminal_event);
}

void ScanCoordinator::publish(const ScanEvent &event)
{
    // Observers run without the lock so they may subscribe or unsubscribe
    std::vector<ScanObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    for (auto *observer : observers)
    {
        try
        {
            observer->onScanEvent(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Scan observer failed on " + scanEventTypeToString(event.type) + " event: " + e.what());
        }
    }
}

bool ScanCoordinator::onScanThread() const
{
    return scan_thread_id_.load() == std::this_thread::get_id();
}
