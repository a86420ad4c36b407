#include "core/media_classifier.hpp"
#include "core/poco_config_manager.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace
{
    std::vector<std::string> sorted(const std::unordered_set<std::string> &set)
    {
        std::vector<std::string> result(set.begin(), set.end());
        std::sort(result.begin(), result.end());
        return result;
    }
}

MediaClassifier::MediaClassifier()
    : MediaClassifier(defaultImageExtensions(), defaultVideoExtensions())
{
}

MediaClassifier::MediaClassifier(const std::vector<std::string> &image_extensions,
                                 const std::vector<std::string> &video_extensions)
{
    for (const auto &ext : image_extensions)
    {
        auto normalized = normalizeExtension(ext);
        if (!normalized.empty())
            image_extensions_.insert(normalized);
    }
    for (const auto &ext : video_extensions)
    {
        auto normalized = normalizeExtension(ext);
        if (!normalized.empty())
            video_extensions_.insert(normalized);
    }
}

MediaClassifier MediaClassifier::fromConfig(const PocoConfigManager &config)
{
    return MediaClassifier(config.getEnabledImageExtensions(), config.getEnabledVideoExtensions());
}

MediaType MediaClassifier::classify(const std::string &extension) const
{
    const std::string ext = normalizeExtension(extension);
    if (ext.empty())
        return MediaType::UNKNOWN;
    if (image_extensions_.count(ext))
        return MediaType::IMAGE;
    if (video_extensions_.count(ext))
        return MediaType::VIDEO;
    return MediaType::UNKNOWN;
}

MediaType MediaClassifier::classifyPath(const std::string &file_path) const
{
    return classify(std::filesystem::path(file_path).extension().string());
}

std::vector<std::string> MediaClassifier::imageExtensions() const
{
    return sorted(image_extensions_);
}

std::vector<std::string> MediaClassifier::videoExtensions() const
{
    return sorted(video_extensions_);
}

std::string MediaClassifier::normalizeExtension(const std::string &extension)
{
    std::string ext = extension;
    ext.erase(ext.begin(), std::find_if(ext.begin(), ext.end(), [](unsigned char c)
                                        { return !std::isspace(c); }));
    ext.erase(std::find_if(ext.rbegin(), ext.rend(), [](unsigned char c)
                           { return !std::isspace(c); })
                  .base(),
              ext.end());
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

const std::vector<std::string> &MediaClassifier::defaultImageExtensions()
{
    static const std::vector<std::string> extensions = {
        "jpg", "jpeg", "png", "bmp", "gif", "webp", "tiff", "tif",
        "svg", "heic", "ico", "raw", "cr2", "nef", "orf", "sr2"};
    return extensions;
}

const std::vector<std::string> &MediaClassifier::defaultVideoExtensions()
{
    static const std::vector<std::string> extensions = {
        "mp4", "mkv", "avi", "mov", "wmv", "flv", "mpg",
        "mpeg", "m4v", "3gp", "webm", "ts", "mts", "m2ts"};
    return extensions;
}
