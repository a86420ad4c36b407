#pragma once

#include "core/media_types.hpp"
#include <cstdint>
#include <string>

/**
 * @brief One indexed file. The path is the identity key; a record is
 * written once and never updated afterwards.
 */
struct MediaRecord
{
    std::string path;      // Absolute, symlink-resolved path
    std::string filename;  // Last path component
    std::string extension; // Lower case, including the leading dot (".jpg"), empty if none
    MediaType type = MediaType::UNKNOWN;
    int64_t discovered_at_ms = 0; // Milliseconds since epoch, stamped by the store on first insert
    uint64_t file_size = 0;
    int64_t modified_at = 0; // Seconds since epoch

    bool operator==(const MediaRecord &other) const
    {
        return path == other.path && filename == other.filename && extension == other.extension &&
               type == other.type && discovered_at_ms == other.discovered_at_ms &&
               file_size == other.file_size && modified_at == other.modified_at;
    }
    bool operator!=(const MediaRecord &other) const { return !(*this == other); }
};
