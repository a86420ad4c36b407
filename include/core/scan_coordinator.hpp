#pragma once

#include "core/media_classifier.hpp"
#include "core/scan_events.hpp"
#include "database/metadata_store.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct ScanOptions
{
    // Minimum spacing between PROGRESS events; 0 emits one per file
    int progress_interval_ms = 50;
};

/**
 * @brief Runs one filesystem walk at a time on a dedicated thread and feeds
 * every discovered file into the MetadataStore.
 *
 * Files are upserted strictly in walk order and a file is reported as
 * processed only after its upsert returned. Cancellation is checked
 * between files, never during an upsert.
 */
class ScanCoordinator
{
public:
    using ClassifierProvider = std::function<MediaClassifier()>;

    ScanCoordinator(MetadataStore &store, ClassifierProvider classifier_provider, ScanOptions options = ScanOptions());
    ~ScanCoordinator();

    ScanCoordinator(const ScanCoordinator &) = delete;
    ScanCoordinator &operator=(const ScanCoordinator &) = delete;

    /**
     * @brief Start scanning root_path in the background and return immediately.
     *
     * Root-level problems (missing path, not a directory, unreadable,
     * store not open) never enter RUNNING: the status becomes FAILED and a
     * single FAILED event is published before this returns.
     */
    ScanStartResult startScan(const std::string &root_path);

    /**
     * @brief Request cooperative cancellation of the running scan
     * @return false if no scan is running or its walk has already finished
     */
    bool cancel();

    // Block until the scan thread has finished
    void wait();

    ScanStatus status() const;
    bool isRunning() const;
    std::string currentTarget() const;
    std::string lastError() const;
    ScanSummary lastSummary() const;

    /**
     * Observers are called on the scan thread (or on the startScan caller
     * for a root-level FAILED event) and may subscribe or unsubscribe from
     * inside the callback. An observer unsubscribed from another thread can
     * still receive an event already being delivered.
     */
    void subscribe(ScanObserver *observer);
    void unsubscribe(ScanObserver *observer);

private:
    void runScan(uint64_t session_id, std::string root_path, MediaClassifier classifier);
    ScanStartResult beginScan(const std::string &root_path, ScanEvent &failure);
    ScanEvent failBeforeStart(uint64_t session_id, const std::string &root_path, const std::string &reason);
    void finish(ScanStatus final_status, const ScanEvent &terminal_event);
    void publish(const ScanEvent &event);
    bool onScanThread() const;

    MetadataStore &store_;
    ClassifierProvider classifier_provider_;
    ScanOptions options_;

    // Serializes startScan/wait around scan_thread_
    std::mutex control_mutex_;
    std::thread scan_thread_;
    std::atomic<std::thread::id> scan_thread_id_{};

    mutable std::mutex state_mutex_;
    ScanStatus status_ = ScanStatus::IDLE;
    std::string current_target_;
    std::string last_error_;
    ScanSummary summary_;
    uint64_t next_session_id_ = 1;
    std::atomic<bool> cancel_requested_{false};
    bool walk_exhausted_ = false;

    std::mutex observers_mutex_;
    std::vector<ScanObserver *> observers_;
};
