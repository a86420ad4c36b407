#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sys/stat.h>

namespace fs = std::filesystem;

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0)
    {
        return std::nullopt;
    }
    if (!S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.modification_time = st.st_mtime;
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    return metadata;
}

MediaRecord FileUtils::toMediaRecord(const std::string &file_path, MediaType type)
{
    fs::path path(file_path);

    MediaRecord record;
    record.path = file_path;
    record.filename = path.filename().string();
    record.extension = path.extension().string();
    std::transform(record.extension.begin(), record.extension.end(), record.extension.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    record.type = type;

    auto metadata = getFileMetadata(file_path);
    if (metadata)
    {
        record.file_size = metadata->file_size;
        record.modified_at = static_cast<int64_t>(metadata->modification_time);
    }
    else
    {
        Logger::debug("Could not stat file, storing without size: " + file_path);
    }
    return record;
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec) && !ec;
}

std::string FileUtils::normalizeFolder(const std::string &folder)
{
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(folder), ec);
    if (ec)
    {
        absolute = fs::path(folder);
    }
    std::string normalized = absolute.lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == fs::path::preferred_separator)
    {
        normalized.pop_back();
    }
    return normalized;
}

bool FileUtils::isUnderFolder(const std::string &file_path, const std::string &folder)
{
    const std::string prefix = normalizeFolder(folder);
    if (prefix.size() == 1 && prefix.front() == fs::path::preferred_separator)
    {
        return file_path.size() > 1 && file_path.front() == fs::path::preferred_separator;
    }
    return file_path.size() > prefix.size() &&
           file_path.compare(0, prefix.size(), prefix) == 0 &&
           file_path[prefix.size()] == fs::path::preferred_separator;
}
