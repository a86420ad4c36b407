#pragma once

#include "core/media_types.hpp"
#include <string>
#include <unordered_set>
#include <vector>

class PocoConfigManager;

/**
 * @brief Maps file extensions to a MediaType.
 *
 * Pure and total: any extension that is in neither set classifies as
 * UNKNOWN. Matching ignores case and a leading dot. An extension listed
 * in both sets classifies as IMAGE.
 */
class MediaClassifier
{
public:
    MediaClassifier();
    MediaClassifier(const std::vector<std::string> &image_extensions,
                    const std::vector<std::string> &video_extensions);

    /**
     * @brief Build a classifier from the enabled extension sets in the configuration
     */
    static MediaClassifier fromConfig(const PocoConfigManager &config);

    MediaType classify(const std::string &extension) const;
    MediaType classifyPath(const std::string &file_path) const;

    std::vector<std::string> imageExtensions() const;
    std::vector<std::string> videoExtensions() const;

    // "JPG", ".jpg" and "jpg" all normalize to "jpg"
    static std::string normalizeExtension(const std::string &extension);

    static const std::vector<std::string> &defaultImageExtensions();
    static const std::vector<std::string> &defaultVideoExtensions();

private:
    std::unordered_set<std::string> image_extensions_;
    std::unordered_set<std::string> video_extensions_;
};
