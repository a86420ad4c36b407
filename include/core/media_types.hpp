#pragma once

#include <algorithm>
#include <cctype>
#include <string>

/**
 * @brief Classification of an indexed file, fixed at ingest time
 */
enum class MediaType
{
    IMAGE,  // Decoded into a thumbnail on demand
    VIDEO,  // Shown with the generic video icon
    UNKNOWN // Indexed but never decoded
};

class MediaTypes
{
public:
    /**
     * @brief Get the persisted name of a media type
     * @param type The media type
     * @return "image", "video" or "unknown"
     */
    static std::string getTypeName(MediaType type)
    {
        switch (type)
        {
        case MediaType::IMAGE:
            return "image";
        case MediaType::VIDEO:
            return "video";
        case MediaType::UNKNOWN:
        default:
            return "unknown";
        }
    }

    /**
     * @brief Convert a stored or user supplied name to a MediaType
     * @param type_str Name in any case
     * @return Matching MediaType, UNKNOWN when the name is not recognised
     */
    static MediaType fromString(const std::string &type_str)
    {
        std::string lowered = type_str;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lowered == "image")
            return MediaType::IMAGE;
        else if (lowered == "video")
            return MediaType::VIDEO;
        else
            return MediaType::UNKNOWN;
    }
};
