#include "core/logger_observer.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>

void LoggerObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!hasLogLevelChange(event))
        return;

    std::string new_log_level = PocoConfigManager::getInstance().getLogLevel();
    Logger::setLevel(new_log_level);
}

bool LoggerObserver::hasLogLevelChange(const ConfigUpdateEvent &event) const
{
    return std::find(event.changed_keys.begin(), event.changed_keys.end(), "log_level") != event.changed_keys.end();
}
