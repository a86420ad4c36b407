#pragma once

#include "core/file_walker.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class ScanStatus
{
    IDLE,
    RUNNING,
    CANCELLING,
    COMPLETED,
    CANCELLED,
    FAILED
};

enum class ScanStartResult
{
    STARTED,
    ALREADY_RUNNING,
    PATH_NOT_FOUND,
    NOT_A_DIRECTORY,
    PERMISSION_DENIED,
    STORE_UNAVAILABLE
};

/**
 * @brief Notification emitted by the scan coordinator.
 *
 * Events of one session arrive in the order the upserts were attempted;
 * COMPLETED, CANCELLED or FAILED is always the last event of a session.
 */
struct ScanEvent
{
    enum class Type
    {
        PROGRESS,
        COMPLETED,
        CANCELLED,
        FAILED
    };

    Type type = Type::PROGRESS;
    uint64_t session_id = 0;
    std::string path; // Last file whose upsert was attempted (root for FAILED)
    size_t files_processed = 0;
    size_t files_inserted = 0;
    size_t files_failed = 0;
    std::string message;

    bool isTerminal() const { return type != Type::PROGRESS; }
};

/**
 * @brief Outcome of the most recent scan session
 */
struct ScanSummary
{
    uint64_t session_id = 0;
    std::string root_path;
    ScanStatus status = ScanStatus::IDLE;
    size_t files_processed = 0;
    size_t files_inserted = 0;
    size_t files_failed = 0;
    std::vector<WalkFailure> walk_failures;
    std::string error_message;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};

    // Shape stored under "last_scan" in the configuration
    nlohmann::json toLastScanInfo() const;
};

std::string scanStatusToString(ScanStatus status);
std::string scanStartResultToString(ScanStartResult result);
std::string scanEventTypeToString(ScanEvent::Type type);

/**
 * @brief Subscriber interface for scan notifications. Callbacks run on the
 * scan thread and must not call ScanCoordinator::startScan or wait.
 */
class ScanObserver
{
public:
    virtual ~ScanObserver() = default;
    virtual void onScanEvent(const ScanEvent &event) = 0;
};

/**
 * @brief Buffers scan events so a render loop can collect them on its own schedule
 */
class ScanEventQueue : public ScanObserver
{
public:
    void onScanEvent(const ScanEvent &event) override;

    // Take everything buffered so far without blocking
    std::vector<ScanEvent> drain();

    // Wait up to timeout for at least one event, then take everything buffered
    std::vector<ScanEvent> waitAndDrain(std::chrono::milliseconds timeout);

    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ScanEvent> events_;
};
