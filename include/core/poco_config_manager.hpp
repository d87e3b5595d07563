#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Process-wide JSON configuration store backed by Poco
 *
 * Keys use dotted paths ("detection.timeout_ms"); array elements are
 * addressed as "models.vit.mean[0]".
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    bool load(const std::string &path);

    /**
     * @brief Replace the whole configuration with a JSON document
     * @throws ConfigurationError if the text is not valid JSON
     */
    void loadFromString(const std::string &json_text);

    nlohmann::json getAll() const;
    void update(const nlohmann::json &patch);

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    double getDouble(const std::string &key, double def) const;
    bool getBool(const std::string &key, bool def) const;

    bool has(const std::string &key) const;

    /**
     * @brief Direct child keys below a prefix, e.g. keys("weights")
     */
    std::vector<std::string> keys(const std::string &prefix) const;

private:
    PocoConfigManager();
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
