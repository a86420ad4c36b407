#include "core/poco_config_manager.hpp"
#include "core/config_observer.hpp"
#include "core/media_classifier.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using Poco::AutoPtr;
using Poco::Util::AbstractConfiguration;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ifstream in(path);
        if (!in.good())
            return false;
        try
        {
            AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
            tmp->load(in);
            cfg_ = tmp;
        }
        catch (const Poco::Exception &e)
        {
            Logger::error("Failed to parse configuration file " + path + ": " + e.displayText());
            return false;
        }
    }

    Logger::info("Configuration loaded from " + path);
    publishEvent(ConfigUpdateEvent{{"log_level", "categories"}, "load"});
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
    {
        Logger::error("Cannot write configuration file: " + path);
        return false;
    }
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::vector<std::string> changed_keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Flatten and set values
        std::function<void(const std::string &, const nlohmann::json &)> apply;
        apply = [&](const std::string &prefix, const nlohmann::json &node)
        {
            if (node.is_object())
            {
                for (auto it = node.begin(); it != node.end(); ++it)
                {
                    std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                    apply(key, it.value());
                }
            }
            else if (!node.is_null())
            {
                if (node.is_boolean())
                    cfg_->setBool(prefix, node.get<bool>());
                else if (node.is_number_integer())
                    cfg_->setInt(prefix, node.get<int>());
                else if (node.is_number_unsigned())
                    cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
                else if (node.is_number_float())
                    cfg_->setDouble(prefix, node.get<double>());
                else if (node.is_string())
                    cfg_->setString(prefix, node.get<std::string>());
                else
                    cfg_->setString(prefix, node.dump());
                changed_keys.push_back(prefix);
            }
        };
        apply("", patch);
    }

    if (!changed_keys.empty())
    {
        publishEvent(ConfigUpdateEvent{changed_keys, "update"});
    }
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getDatabasePath() const
{
    return getString("database.path", "media.db");
}

int PocoConfigManager::getDatabaseBusyTimeoutMs() const
{
    return getInt("database.busy_timeout_ms", 30000);
}

int PocoConfigManager::getProgressIntervalMs() const
{
    return getInt("scan.progress_interval_ms", 50);
}

int PocoConfigManager::getThumbnailMaxDimension() const
{
    return getInt("thumbnail.max_dimension", 100);
}

int PocoConfigManager::getMaxDecoderThreads() const
{
    return getInt("threading.max_decoder_threads", 2);
}

std::map<std::string, bool> PocoConfigManager::getFileTypes(const std::string &category) const
{
    const std::string prefix = categoryKey(category);
    std::map<std::string, bool> types;

    std::lock_guard<std::mutex> lock(mutex_);
    AbstractConfiguration::Keys keys;
    cfg_->keys(prefix, keys);
    for (const auto &ext : keys)
    {
        try
        {
            types[ext] = cfg_->getBool(prefix + "." + ext);
        }
        catch (const Poco::Exception &e)
        {
            Logger::warn("Ignoring non-boolean file type entry " + prefix + "." + ext + ": " + e.displayText());
        }
    }
    return types;
}

std::vector<std::string> PocoConfigManager::getEnabledImageExtensions() const
{
    return getEnabledExtensionsForCategory("image");
}

std::vector<std::string> PocoConfigManager::getEnabledVideoExtensions() const
{
    return getEnabledExtensionsForCategory("video");
}

bool PocoConfigManager::addExtension(const std::string &category, const std::string &extension)
{
    const std::string ext = MediaClassifier::normalizeExtension(extension);
    if (ext.empty())
        throw std::invalid_argument("Empty file extension");

    const std::string key = categoryKey(category) + "." + ext;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cfg_->getBool(key, false))
            return false;
        cfg_->setBool(key, true);
    }

    Logger::info("Enabled ." + ext + " as " + category);
    publishEvent(ConfigUpdateEvent{{key}, "formats"});
    return true;
}

bool PocoConfigManager::removeExtension(const std::string &category, const std::string &extension)
{
    const std::string ext = MediaClassifier::normalizeExtension(extension);
    if (ext.empty())
        throw std::invalid_argument("Empty file extension");

    const std::string key = categoryKey(category) + "." + ext;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cfg_->getBool(key, false))
            return false;
        cfg_->setBool(key, false);
    }

    Logger::info("Disabled ." + ext + " as " + category);
    publishEvent(ConfigUpdateEvent{{key}, "formats"});
    return true;
}

nlohmann::json PocoConfigManager::getLastScanInfo() const
{
    nlohmann::json info;
    info["timestamp"] = getString("last_scan.timestamp", "Never");
    info["status"] = getString("last_scan.status", "N/A");
    info["root"] = getString("last_scan.root", "");
    info["new_files_count"] = getInt("last_scan.new_files_count", 0);
    info["total_files_scanned"] = getInt("last_scan.total_files_scanned", 0);
    return info;
}

void PocoConfigManager::setLastScanInfo(const nlohmann::json &info)
{
    update(nlohmann::json{{"last_scan", info}});
}

bool PocoConfigManager::validateConfig() const
{
    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    int max_dimension = getThumbnailMaxDimension();
    if (max_dimension <= 0)
    {
        Logger::error("Invalid thumbnail size: " + std::to_string(max_dimension));
        return false;
    }

    int decoder_threads = getMaxDecoderThreads();
    if (decoder_threads < 1 || decoder_threads > 64)
    {
        Logger::error("Invalid decoder thread count: " + std::to_string(decoder_threads));
        return false;
    }

    if (getProgressIntervalMs() < 0)
    {
        Logger::error("Invalid progress interval: " + std::to_string(getProgressIntervalMs()));
        return false;
    }

    return true;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_ = new JSONConfiguration();
    cfg_->setString("log_level", "INFO");

    cfg_->setString("database.path", "media.db");
    cfg_->setInt("database.busy_timeout_ms", 30000);

    cfg_->setInt("scan.progress_interval_ms", 50);

    cfg_->setInt("thumbnail.max_dimension", 100);
    cfg_->setInt("threading.max_decoder_threads", 2);

    for (const auto &ext : MediaClassifier::defaultImageExtensions())
        cfg_->setBool("categories.images." + ext, true);
    for (const auto &ext : MediaClassifier::defaultVideoExtensions())
        cfg_->setBool("categories.video." + ext, true);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

void PocoConfigManager::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
        observers_.push_back(observer);
}

void PocoConfigManager::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

std::string PocoConfigManager::categoryKey(const std::string &category)
{
    if (category == "image" || category == "images")
        return "categories.images";
    if (category == "video")
        return "categories.video";
    throw std::invalid_argument("Unknown media category: " + category);
}

void PocoConfigManager::publishEvent(const ConfigUpdateEvent &event)
{
    std::vector<ConfigObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    for (auto *observer : observers)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Config observer failed: " + std::string(e.what()));
        }
    }
}

std::vector<std::string> PocoConfigManager::getEnabledExtensionsForCategory(const std::string &category) const
{
    std::vector<std::string> enabled_extensions;
    for (const auto &pair : getFileTypes(category))
    {
        if (pair.second)
            enabled_extensions.push_back(pair.first);
    }
    return enabled_extensions;
}
