#include "core/gallery_data_provider.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

GalleryDataProvider::GalleryDataProvider(MetadataStore &store, ThumbnailCache &thumbnails)
    : store_(store), thumbnails_(thumbnails), rows_(std::make_shared<const std::vector<MediaRecord>>())
{
}

void GalleryDataProvider::refresh()
{
    std::optional<std::string> filter = folderFilter();

    // Load outside the lock; readers keep using the previous snapshot meanwhile
    auto rows = std::make_shared<const std::vector<MediaRecord>>(
        filter ? store_.getByFolder(*filter) : store_.loadAll());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        rows_ = rows;
    }
    Logger::debug("Gallery refreshed: " + std::to_string(rows->size()) + " rows" +
                  (filter ? " under " + *filter : ""));
}

size_t GalleryDataProvider::rowCount() const
{
    return snapshot()->size();
}

MediaRecord GalleryDataProvider::rowAt(size_t index) const
{
    Snapshot rows = snapshot();
    if (index >= rows->size())
    {
        throw std::out_of_range("Row " + std::to_string(index) + " out of range (row count " +
                                std::to_string(rows->size()) + ")");
    }
    return (*rows)[index];
}

Thumbnail GalleryDataProvider::thumbnailFor(size_t index)
{
    MediaRecord record = rowAt(index);
    return thumbnails_.get(record.path, record.type);
}

GalleryDataProvider::Snapshot GalleryDataProvider::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_;
}

void GalleryDataProvider::setFolderFilter(const std::string &folder)
{
    std::lock_guard<std::mutex> lock(mutex_);
    folder_filter_ = FileUtils::normalizeFolder(folder);
}

void GalleryDataProvider::clearFolderFilter()
{
    std::lock_guard<std::mutex> lock(mutex_);
    folder_filter_.reset();
}

std::optional<std::string> GalleryDataProvider::folderFilter() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return folder_filter_;
}
