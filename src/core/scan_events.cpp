#include "core/scan_events.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

nlohmann::json ScanSummary::toLastScanInfo() const
{
    std::time_t finished = std::chrono::system_clock::to_time_t(finished_at);
    std::tm local_tm{};
    localtime_r(&finished, &local_tm);
    std::ostringstream timestamp;
    timestamp << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");

    nlohmann::json info;
    info["timestamp"] = timestamp.str();
    info["status"] = scanStatusToString(status);
    info["root"] = root_path;
    info["new_files_count"] = static_cast<int>(files_inserted);
    info["total_files_scanned"] = static_cast<int>(files_processed);
    return info;
}

std::string scanStatusToString(ScanStatus status)
{
    switch (status)
    {
    case ScanStatus::IDLE:
        return "Idle";
    case ScanStatus::RUNNING:
        return "Running";
    case ScanStatus::CANCELLING:
        return "Cancelling";
    case ScanStatus::COMPLETED:
        return "Completed";
    case ScanStatus::CANCELLED:
        return "Cancelled";
    case ScanStatus::FAILED:
        return "Failed";
    default:
        return "Unknown";
    }
}

std::string scanStartResultToString(ScanStartResult result)
{
    switch (result)
    {
    case ScanStartResult::STARTED:
        return "started";
    case ScanStartResult::ALREADY_RUNNING:
        return "a scan is already running";
    case ScanStartResult::PATH_NOT_FOUND:
        return "path not found";
    case ScanStartResult::NOT_A_DIRECTORY:
        return "not a directory";
    case ScanStartResult::PERMISSION_DENIED:
        return "permission denied";
    case ScanStartResult::STORE_UNAVAILABLE:
        return "metadata store unavailable";
    default:
        return "unknown";
    }
}

std::string scanEventTypeToString(ScanEvent::Type type)
{
    switch (type)
    {
    case ScanEvent::Type::PROGRESS:
        return "progress";
    case ScanEvent::Type::COMPLETED:
        return "completed";
    case ScanEvent::Type::CANCELLED:
        return "cancelled";
    case ScanEvent::Type::FAILED:
        return "failed";
    default:
        return "unknown";
    }
}

void ScanEventQueue::onScanEvent(const ScanEvent &event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }
    cv_.notify_all();
}

std::vector<ScanEvent> ScanEventQueue::drain()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScanEvent> drained(events_.begin(), events_.end());
    events_.clear();
    return drained;
}

std::vector<ScanEvent> ScanEventQueue::waitAndDrain(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]
                 { return !events_.empty(); });
    std::vector<ScanEvent> drained(events_.begin(), events_.end());
    events_.clear();
    return drained;
}

size_t ScanEventQueue::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}
