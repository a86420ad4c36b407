#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

class ConfigObserver;
struct ConfigUpdateEvent;

/**
 * @brief Process-wide configuration backed by a Poco JSONConfiguration.
 *
 * Keys are dotted paths ("thumbnail.max_dimension"). The classified
 * extension sets live under "categories.images" and "categories.video"
 * as extension -> enabled flags.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;

    std::string getLogLevel() const;
    std::string getDatabasePath() const;
    int getDatabaseBusyTimeoutMs() const;
    int getProgressIntervalMs() const;
    int getThumbnailMaxDimension() const;
    int getMaxDecoderThreads() const;

    // Extension sets, normalized to lower case without the leading dot
    std::map<std::string, bool> getFileTypes(const std::string &category) const;
    std::vector<std::string> getEnabledImageExtensions() const;
    std::vector<std::string> getEnabledVideoExtensions() const;

    /**
     * @brief Enable an extension for "image" or "video"
     * @return false if it was already enabled
     * @throws std::invalid_argument for an unknown category or empty extension
     */
    bool addExtension(const std::string &category, const std::string &extension);

    /**
     * @brief Disable an extension for "image" or "video"
     * @return false if it was not enabled
     * @throws std::invalid_argument for an unknown category or empty extension
     */
    bool removeExtension(const std::string &category, const std::string &extension);

    // Summary of the most recent scan
    nlohmann::json getLastScanInfo() const;
    void setLastScanInfo(const nlohmann::json &info);

    bool validateConfig() const;
    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    static std::string categoryKey(const std::string &category);
    void publishEvent(const ConfigUpdateEvent &event);
    std::vector<std::string> getEnabledExtensionsForCategory(const std::string &category) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;

    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;
};
