#include "core/logger_observer.hpp"
#include "logging/logger.hpp"

void LoggerObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("log_level"))
        return;

    const std::string new_log_level = store_.getString("log_level", "INFO");
    Logger::info("LoggerObserver: log level change to " + new_log_level + " (update " + event.update_id +
                 " from " + event.source + ")");
    Logger::setLevel(new_log_level);
}
