#pragma once

#include "core/media_record.hpp"
#include "core/thumbnail_cache.hpp"
#include "database/metadata_store.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Index-addressable view over the store for a virtualized gallery.
 *
 * Rows come from an immutable snapshot that refresh() replaces as a whole,
 * so readers racing a refresh see either the old or the new list, never a
 * mix. Thumbnails are delegated to the ThumbnailCache.
 */
class GalleryDataProvider
{
public:
    using Snapshot = std::shared_ptr<const std::vector<MediaRecord>>;

    GalleryDataProvider(MetadataStore &store, ThumbnailCache &thumbnails);

    // Re-read the store (or the filtered folder) and swap in the new snapshot
    void refresh();

    size_t rowCount() const;

    /**
     * @brief Record at index
     * @throws std::out_of_range if index >= rowCount()
     */
    MediaRecord rowAt(size_t index) const;

    /**
     * @brief Thumbnail of the record at index; never blocks on decode
     * @throws std::out_of_range if index >= rowCount()
     */
    Thumbnail thumbnailFor(size_t index);

    // Consistent view for reading several rows at once
    Snapshot snapshot() const;

    // Restrict the next refresh() to files under folder
    void setFolderFilter(const std::string &folder);
    void clearFolderFilter();
    std::optional<std::string> folderFilter() const;

private:
    MetadataStore &store_;
    ThumbnailCache &thumbnails_;

    mutable std::mutex mutex_;
    Snapshot rows_;
    std::optional<std::string> folder_filter_;
};
