#pragma once

#include "core/config_observer.hpp"
#include "core/poco_config_manager.hpp"

/**
 * @brief Observer that applies log level configuration changes
 */
class LoggerObserver : public ConfigObserver
{
public:
    explicit LoggerObserver(const PocoConfigManager &store = PocoConfigManager::getInstance()) : store_(store) {}
    ~LoggerObserver() override = default;

    /**
     * @brief Handle configuration updates
     * @param event Configuration update event
     */
    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    const PocoConfigManager &store_;
};
