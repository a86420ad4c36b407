#include "core/thumbnail_cache.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

std::string thumbnailStateToString(Thumbnail::State state)
{
    switch (state)
    {
    case Thumbnail::State::READY:
        return "ready";
    case Thumbnail::State::PENDING:
        return "pending";
    case Thumbnail::State::FAILED:
        return "failed";
    case Thumbnail::State::VIDEO:
        return "video";
    default:
        return "unknown";
    }
}

ThumbnailCache::ThumbnailCache(int max_dimension, int max_decoder_threads, Decoder decoder)
    : max_dimension_(std::max(1, max_dimension)),
      decoder_(std::move(decoder)),
      arena_(std::max(1, max_decoder_threads), 0)
{
    if (!decoder_)
    {
        decoder_ = &ThumbnailCache::decodeAndScale;
    }

    pending_placeholder_ = makePlaceholder(cv::Scalar(90, 90, 90), "...");
    failed_placeholder_ = makePlaceholder(cv::Scalar(40, 40, 160), "X");
    video_placeholder_ = makePlaceholder(cv::Scalar(120, 60, 20), "VID");

    Logger::debug("ThumbnailCache: max dimension " + std::to_string(max_dimension_) +
                  ", decoder threads " + std::to_string(std::max(1, max_decoder_threads)));
}

ThumbnailCache::~ThumbnailCache()
{
    waitIdle();
}

Thumbnail ThumbnailCache::get(const std::string &path, MediaType type)
{
    if (type == MediaType::VIDEO)
    {
        return Thumbnail{Thumbnail::State::VIDEO, video_placeholder_};
    }
    if (type != MediaType::IMAGE)
    {
        return Thumbnail{Thumbnail::State::FAILED, failed_placeholder_};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(path);
        if (it != entries_.end())
        {
            return Thumbnail{it->second.state, it->second.image};
        }
        if (!in_flight_.insert(path).second)
        {
            return Thumbnail{Thumbnail::State::PENDING, pending_placeholder_};
        }
        ++decode_count_;
    }

    try
    {
        schedule([this, path]
                 { decode(path); });
    }
    catch (const std::exception &e)
    {
        // Not cached, so a later request tries again
        Logger::error("Failed to queue thumbnail decode for " + path + ": " + e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(path);
        --decode_count_;
        idle_cv_.notify_all();
        return Thumbnail{Thumbnail::State::FAILED, failed_placeholder_};
    }

    return Thumbnail{Thumbnail::State::PENDING, pending_placeholder_};
}

void ThumbnailCache::schedule(std::function<void()> task)
{
    arena_.enqueue(std::move(task));
}

void ThumbnailCache::decode(const std::string &path)
{
    cv::Mat scaled;
    try
    {
        scaled = decoder_(path, max_dimension_);
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("Thumbnail decode error for " + path + ": " + e.what());
        scaled.release();
    }
    catch (const std::exception &e)
    {
        Logger::warn("Thumbnail decode error for " + path + ": " + e.what());
        scaled.release();
    }

    Entry entry;
    if (scaled.empty())
    {
        Logger::warn("Failed to decode thumbnail for " + path);
        entry = Entry{Thumbnail::State::FAILED, failed_placeholder_};
    }
    else
    {
        Logger::debug("Decoded thumbnail for " + path + " (" + std::to_string(scaled.cols) + "x" +
                      std::to_string(scaled.rows) + ")");
        entry = Entry{Thumbnail::State::READY, std::make_shared<const cv::Mat>(std::move(scaled))};
    }
    const auto state = entry.state;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[path] = std::move(entry);
    }

    ReadyCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = ready_callback_;
    }
    if (callback)
    {
        try
        {
            callback(path, state);
        }
        catch (const std::exception &e)
        {
            Logger::error("Thumbnail ready callback failed for " + path + ": " + e.what());
        }
    }

    // Leave in_flight_ last so waitIdle() returns only after the callback ran
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(path);
    idle_cv_.notify_all();
}

void ThumbnailCache::setReadyCallback(ReadyCallback callback)
{
    std::lock_guard<std::mutex> lock(callback_mutex_);
    ready_callback_ = std::move(callback);
}

void ThumbnailCache::waitIdle()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]
                  { return in_flight_.empty(); });
}

size_t ThumbnailCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ThumbnailCache::inFlight() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

size_t ThumbnailCache::decodeCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return decode_count_;
}

cv::Mat ThumbnailCache::decodeAndScale(const std::string &path, int max_dimension)
{
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty())
    {
        return cv::Mat();
    }

    const int longest = std::max(image.cols, image.rows);
    if (longest <= max_dimension)
    {
        return image;
    }

    const double scale = static_cast<double>(max_dimension) / longest;
    const int width = std::max(1, static_cast<int>(image.cols * scale + 0.5));
    const int height = std::max(1, static_cast<int>(image.rows * scale + 0.5));

    cv::Mat scaled;
    cv::resize(image, scaled, cv::Size(std::min(width, max_dimension), std::min(height, max_dimension)), 0, 0,
               cv::INTER_AREA);
    return scaled;
}

std::shared_ptr<const cv::Mat> ThumbnailCache::makePlaceholder(const cv::Scalar &background, const std::string &label) const
{
    cv::Mat image(max_dimension_, max_dimension_, CV_8UC3, background);

    const int font = cv::FONT_HERSHEY_SIMPLEX;
    const double font_scale = std::max(0.3, max_dimension_ / 100.0);
    int baseline = 0;
    cv::Size text = cv::getTextSize(label, font, font_scale, 1, &baseline);
    cv::Point origin((image.cols - text.width) / 2, (image.rows + text.height) / 2);
    cv::putText(image, label, origin, font, font_scale, cv::Scalar(230, 230, 230), 1, cv::LINE_AA);

    return std::make_shared<const cv::Mat>(std::move(image));
}
