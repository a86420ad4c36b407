#pragma once

#include "core/media_types.hpp"
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <opencv2/core.hpp>
#include <tbb/task_arena.h>

/**
 * @brief Result of a thumbnail lookup. image is never null: non-READY
 * states carry the matching placeholder.
 */
struct Thumbnail
{
    enum class State
    {
        READY,
        PENDING,
        FAILED,
        VIDEO
    };

    State state = State::PENDING;
    std::shared_ptr<const cv::Mat> image;
};

std::string thumbnailStateToString(Thumbnail::State state);

/**
 * @brief In-memory, decode-on-first-request thumbnail cache.
 *
 * Image decodes run on a bounded TBB arena. Concurrent requests for the
 * same uncached path coalesce into one decode. A failed decode is cached
 * so the path is never retried. Entries live until the cache is destroyed;
 * there is no eviction.
 */
class ThumbnailCache
{
public:
    // Returns the scaled image, or an empty Mat on failure
    using Decoder = std::function<cv::Mat(const std::string &path, int max_dimension)>;
    using ReadyCallback = std::function<void(const std::string &path, Thumbnail::State state)>;

    explicit ThumbnailCache(int max_dimension = 100, int max_decoder_threads = 2, Decoder decoder = Decoder());
    virtual ~ThumbnailCache();

    ThumbnailCache(const ThumbnailCache &) = delete;
    ThumbnailCache &operator=(const ThumbnailCache &) = delete;

    /**
     * @brief Never blocks on I/O. A cache miss for an image schedules a
     * decode and returns PENDING with the pending placeholder.
     */
    Thumbnail get(const std::string &path, MediaType type);

    // Called on a decoder thread after each decode has been stored
    void setReadyCallback(ReadyCallback callback);

    // Block until no decode is in flight
    void waitIdle();

    size_t size() const;
    size_t inFlight() const;
    size_t decodeCount() const;
    int maxDimension() const { return max_dimension_; }

    /**
     * @brief imread + aspect-preserving INTER_AREA downscale so the longest
     * side is at most max_dimension. Smaller images are kept as-is.
     */
    static cv::Mat decodeAndScale(const std::string &path, int max_dimension);

protected:
    // Hands a decode task to the decoder arena; may throw if it cannot be queued
    virtual void schedule(std::function<void()> task);

private:
    struct Entry
    {
        Thumbnail::State state;
        std::shared_ptr<const cv::Mat> image;
    };

    void decode(const std::string &path);
    std::shared_ptr<const cv::Mat> makePlaceholder(const cv::Scalar &background, const std::string &label) const;

    const int max_dimension_;
    Decoder decoder_;

    std::shared_ptr<const cv::Mat> pending_placeholder_;
    std::shared_ptr<const cv::Mat> failed_placeholder_;
    std::shared_ptr<const cv::Mat> video_placeholder_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_set<std::string> in_flight_;
    size_t decode_count_ = 0;

    std::mutex callback_mutex_;
    ReadyCallback ready_callback_;

    // Decodes are enqueued fire-and-forget; in_flight_ tracks completion
    tbb::task_arena arena_;
};
