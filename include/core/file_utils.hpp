#pragma once

#include "core/media_record.hpp"
#include <filesystem>
#include <string>
#include <optional>
#include <ctime>

namespace fs = std::filesystem;

/**
 * @brief File attributes captured at ingest (no file content is read)
 */
struct FileMetadata
{
    std::string file_path;
    std::time_t modification_time; // Last modification time
    uint64_t file_size;            // File size in bytes
};

/**
 * @brief File utilities shared by the walker, the store and the front end
 */
class FileUtils
{
public:
    /**
     * @brief Get file metadata efficiently (no file content reading)
     * @param file_path Path to the file
     * @return Optional FileMetadata if file exists and is accessible
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * @brief Build the record for a discovered file, filling the derived and stat fields
     * @param file_path Absolute path of the file
     * @param type Classification of the file
     * @return MediaRecord with discovered_at_ms left at 0 for the store to stamp
     */
    static MediaRecord toMediaRecord(const std::string &file_path, MediaType type);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Absolute, lexically normal form of a folder path without a trailing separator
     */
    static std::string normalizeFolder(const std::string &folder);

    /**
     * @brief Separator-aware prefix test: "/a/b" contains "/a/b/x.jpg" but not "/a/bc/x.jpg"
     */
    static bool isUnderFolder(const std::string &file_path, const std::string &folder);
};
