#pragma once

#include <string>
#include <vector>

/**
 * @brief One accepted change to the detection configuration
 *
 * Keys are dotted paths ("weights.ela", "detection.timeout_ms"). A patch that
 * replaces an array reports the array key itself ("models.vit.mean").
 */
struct ConfigUpdateEvent
{
    std::vector<std::string> changed_keys;
    std::string source;          // "api", "file", "cli"
    std::string update_id;       // "cfg-<epoch ms>-<counter>"
    std::string weight_table_id; // Weight table in effect after the update

    // True if key itself or anything below it ("weights" matches "weights.ela") changed
    bool touches(const std::string &key) const
    {
        for (const auto &changed : changed_keys)
        {
            if (changed == key || (changed.size() > key.size() && changed.compare(0, key.size(), key) == 0 &&
                                   changed[key.size()] == '.'))
                return true;
        }
        return false;
    }
};

class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;

    // Called after the new values are visible through DetectionConfigManager::snapshot()
    virtual void onConfigUpdate(const ConfigUpdateEvent &event) = 0;
};
