#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config_observer.hpp"
#include "core/ensemble_aggregator.hpp"
#include "core/model_registry.hpp"
#include "core/pixel_forensics_analyzer.hpp"
#include "core/poco_config_manager.hpp"

/**
 * @brief Validated, immutable snapshot of the engine configuration
 */
struct DetectionConfig
{
    std::string log_level = "INFO";

    double decision_threshold = kDefaultDecisionThreshold;
    double default_weight = kDefaultMethodWeight;
    int max_contributing_factors = kDefaultMaxContributingFactors;
    int timeout_ms = 30000;
    int max_workers = 0; // 0 = hardware concurrency
    std::string weight_table_id = "default";
    int max_video_frames = 8;

    std::map<std::string, double> weights;
    std::vector<ModelSpec> models;
    ForensicsSettings forensics;

    std::string summary_db_path = "detection_results.db";
    std::string detail_db_path = "detection_details.db";
    int max_retries = 3;

    /**
     * @brief Built-in configuration: six method weights and the two default classifiers
     */
    static DetectionConfig defaults();

    /**
     * @throws ConfigurationError describing the first invalid value
     */
    void validate() const;

    MethodWeights methodWeights() const;
    AggregationConfig aggregationConfig(const std::string &model_registry_version) const;
};

/**
 * @brief Reads, validates and updates the engine configuration held by PocoConfigManager
 *
 * Observers are notified after every accepted update; an update that fails
 * validation is rolled back and reported as ConfigurationError.
 */
class DetectionConfigManager
{
public:
    explicit DetectionConfigManager(PocoConfigManager &store = PocoConfigManager::getInstance());

    /**
     * @brief Load a JSON configuration file
     * @return false if the file does not exist (built-in defaults stay in effect)
     * @throws ConfigurationError if the file is malformed or holds invalid values
     */
    bool loadFile(const std::string &path);

    /**
     * @brief Current configuration with defaults filled in
     * @throws ConfigurationError on invalid values
     */
    DetectionConfig snapshot() const;

    /**
     * @brief Apply a partial JSON patch, e.g. {"weights": {"ela": 0.3}}
     * @throws ConfigurationError if the patched configuration is invalid
     */
    void update(const nlohmann::json &patch, const std::string &source = "api");

    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

private:
    static std::vector<std::string> flattenKeys(const nlohmann::json &patch, const std::string &prefix = "");
    void notifyObservers(const ConfigUpdateEvent &event);

    PocoConfigManager &store_;
    std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;
};
