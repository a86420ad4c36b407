#pragma once

#include "core/config_observer.hpp"

/**
 * @brief Re-applies the configured log level whenever "log_level" changes
 */
class LoggerObserver : public ConfigObserver
{
public:
    LoggerObserver() = default;
    ~LoggerObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    bool hasLogLevelChange(const ConfigUpdateEvent &event) const;
};
