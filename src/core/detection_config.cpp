#include "core/detection_config.hpp"
#include "core/detection_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>

namespace
{
    const cv::Scalar kImageNetMean(0.485, 0.456, 0.406);
    const cv::Scalar kImageNetStd(0.229, 0.224, 0.225);

    bool nonNegative(double value)
    {
        return std::isfinite(value) && value >= 0.0;
    }

    std::string nextUpdateId()
    {
        static std::atomic<unsigned long> counter{0};
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return "cfg-" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(now).count()) +
               "-" + std::to_string(++counter);
    }

    ModelSpec readModelSpec(const PocoConfigManager &store, const std::string &id, const ModelSpec &fallback)
    {
        const std::string prefix = "models." + id + ".";
        ModelSpec spec = fallback;
        spec.descriptor.id = id;
        spec.path = store.getString(prefix + "path", fallback.path.empty() ? "models/" + id + ".onnx" : fallback.path);
        spec.descriptor.version = store.getString(prefix + "version", fallback.descriptor.version.empty() ? "1.0" : fallback.descriptor.version);
        spec.descriptor.display_name = store.getString(prefix + "display_name", fallback.descriptor.display_name.empty() ? id : fallback.descriptor.display_name);
        spec.descriptor.preprocessing.input_size = store.getInt(prefix + "input_size", fallback.descriptor.preprocessing.input_size);
        spec.descriptor.preprocessing.resize_to = store.getInt(prefix + "resize_to", fallback.descriptor.preprocessing.resize_to);
        for (int c = 0; c < 3; ++c)
        {
            const std::string index = "[" + std::to_string(c) + "]";
            spec.descriptor.preprocessing.mean[c] = store.getDouble(prefix + "mean" + index, fallback.descriptor.preprocessing.mean[c]);
            spec.descriptor.preprocessing.std[c] = store.getDouble(prefix + "std" + index, fallback.descriptor.preprocessing.std[c]);
        }
        spec.ai_class_index = store.getInt(prefix + "ai_class_index", fallback.ai_class_index);
        spec.enabled = store.getBool(prefix + "enabled", fallback.enabled);
        return spec;
    }
}

DetectionConfig DetectionConfig::defaults()
{
    DetectionConfig config;
    config.weights = {
        {"metadata", 0.15},
        {"ela", 0.20},
        {"prnu", 0.20},
        {"texture", 0.15},
        {"vit", 0.15},
        {"resnet_nodown", 0.15}};

    ModelSpec vit;
    vit.descriptor.id = "vit";
    vit.descriptor.display_name = "Vision Transformer patch classifier";
    vit.descriptor.version = "1.0";
    vit.descriptor.preprocessing.input_size = 224;
    vit.path = "models/vit_detector.onnx";
    vit.ai_class_index = 1;

    ModelSpec resnet;
    resnet.descriptor.id = "resnet_nodown";
    resnet.descriptor.display_name = "ResNet-50 no-downsampling GAN artifact classifier";
    resnet.descriptor.version = "1.0";
    resnet.descriptor.preprocessing.input_size = 224;
    resnet.descriptor.preprocessing.resize_to = 256;
    resnet.descriptor.preprocessing.mean = kImageNetMean;
    resnet.descriptor.preprocessing.std = kImageNetStd;
    resnet.path = "models/resnet_nodown.onnx";
    resnet.ai_class_index = 0; // single logit; sigmoid applies

    config.models = {vit, resnet};
    return config;
}

void DetectionConfig::validate() const
{
    if (!(decision_threshold >= 0.0 && decision_threshold <= 1.0))
        throw ConfigurationError("detection.decision_threshold must be within [0,1]");
    if (!nonNegative(default_weight))
        throw ConfigurationError("detection.default_weight must be a non-negative number");
    if (max_contributing_factors < 0)
        throw ConfigurationError("detection.max_contributing_factors must not be negative");
    if (timeout_ms <= 0)
        throw ConfigurationError("detection.timeout_ms must be positive");
    if (max_workers < 0)
        throw ConfigurationError("detection.max_workers must not be negative");
    if (max_video_frames < 1)
        throw ConfigurationError("detection.max_video_frames must be at least 1");
    if (weight_table_id.empty())
        throw ConfigurationError("detection.weight_table_id must not be empty");

    for (const auto &[method, weight] : weights)
    {
        if (!nonNegative(weight))
            throw ConfigurationError("weights." + method + " must be a non-negative number");
    }

    if (forensics.ela_quality < 1 || forensics.ela_quality > 100)
        throw ConfigurationError("forensics.ela_quality must be within [1,100]");
    if (forensics.tile_size < 8)
        throw ConfigurationError("forensics.tile_size must be at least 8");
    if (!nonNegative(forensics.texture_smooth_variance))
        throw ConfigurationError("forensics.texture_smooth_variance must be a non-negative number");
    if (!(forensics.texture_uniformity_threshold > 0.0 && forensics.texture_uniformity_threshold < 1.0))
        throw ConfigurationError("forensics.texture_uniformity_threshold must be within (0,1)");
    if (forensics.max_dimension < 2 * forensics.tile_size)
        throw ConfigurationError("forensics.max_dimension must be at least twice the tile size");

    for (const auto &model : models)
    {
        const std::string prefix = "models." + model.descriptor.id;
        const auto &pre = model.descriptor.preprocessing;
        if (pre.input_size <= 0)
            throw ConfigurationError(prefix + ".input_size must be positive");
        if (pre.resize_to != 0 && pre.resize_to < pre.input_size)
            throw ConfigurationError(prefix + ".resize_to must be 0 or at least input_size");
        for (int c = 0; c < 3; ++c)
        {
            if (!(pre.std[c] > 0.0))
                throw ConfigurationError(prefix + ".std values must be positive");
        }
        if (model.ai_class_index < 0)
            throw ConfigurationError(prefix + ".ai_class_index must not be negative");
    }

    if (summary_db_path.empty() || detail_db_path.empty())
        throw ConfigurationError("database paths must not be empty");
    if (max_retries < 1)
        throw ConfigurationError("database.max_retries must be at least 1");
}

MethodWeights DetectionConfig::methodWeights() const
{
    MethodWeights method_weights(default_weight);
    for (const auto &[method, weight] : weights)
    {
        method_weights.setWeight(method, weight);
    }
    return method_weights;
}

AggregationConfig DetectionConfig::aggregationConfig(const std::string &model_registry_version) const
{
    AggregationConfig config{methodWeights()};
    config.decision_threshold = decision_threshold;
    config.max_contributing_factors = max_contributing_factors;
    config.weight_table_id = weight_table_id;
    config.model_registry_version = model_registry_version;
    return config;
}

DetectionConfigManager::DetectionConfigManager(PocoConfigManager &store)
    : store_(store)
{
}

bool DetectionConfigManager::loadFile(const std::string &path)
{
    if (!store_.load(path))
    {
        Logger::warn("Configuration file not found: " + path + ", using built-in defaults");
        return false;
    }
    const DetectionConfig config = snapshot();
    Logger::info("Loaded configuration from " + path + " (weight table " + config.weight_table_id + ")");
    return true;
}

DetectionConfig DetectionConfigManager::snapshot() const
{
    DetectionConfig config = DetectionConfig::defaults();

    config.log_level = store_.getString("log_level", config.log_level);

    config.decision_threshold = store_.getDouble("detection.decision_threshold", config.decision_threshold);
    config.default_weight = store_.getDouble("detection.default_weight", config.default_weight);
    config.max_contributing_factors = store_.getInt("detection.max_contributing_factors", config.max_contributing_factors);
    config.timeout_ms = store_.getInt("detection.timeout_ms", config.timeout_ms);
    config.max_workers = store_.getInt("detection.max_workers", config.max_workers);
    config.weight_table_id = store_.getString("detection.weight_table_id", config.weight_table_id);
    config.max_video_frames = store_.getInt("detection.max_video_frames", config.max_video_frames);

    for (const auto &method : store_.keys("weights"))
    {
        config.weights[method] = store_.getDouble("weights." + method, config.default_weight);
    }

    const auto model_ids = store_.keys("models");
    if (!model_ids.empty())
    {
        std::vector<ModelSpec> models;
        for (const auto &id : model_ids)
        {
            ModelSpec fallback;
            auto builtin = std::find_if(config.models.begin(), config.models.end(),
                                        [&id](const ModelSpec &m)
                                        { return m.descriptor.id == id; });
            if (builtin != config.models.end())
                fallback = *builtin;
            models.push_back(readModelSpec(store_, id, fallback));
        }
        config.models = std::move(models);
    }

    config.forensics.ela_quality = store_.getInt("forensics.ela_quality", config.forensics.ela_quality);
    config.forensics.tile_size = store_.getInt("forensics.tile_size", config.forensics.tile_size);
    config.forensics.texture_smooth_variance = store_.getDouble("forensics.texture_smooth_variance", config.forensics.texture_smooth_variance);
    config.forensics.texture_uniformity_threshold = store_.getDouble("forensics.texture_uniformity_threshold", config.forensics.texture_uniformity_threshold);
    config.forensics.max_dimension = store_.getInt("forensics.max_dimension", config.forensics.max_dimension);
    config.forensics.artifact_dir = store_.getString("forensics.artifact_dir", config.forensics.artifact_dir);

    config.summary_db_path = store_.getString("database.summary_path", config.summary_db_path);
    config.detail_db_path = store_.getString("database.detail_path", config.detail_db_path);
    config.max_retries = store_.getInt("database.max_retries", config.max_retries);

    config.validate();
    return config;
}

void DetectionConfigManager::update(const nlohmann::json &patch, const std::string &source)
{
    if (!patch.is_object())
    {
        throw ConfigurationError("configuration patch must be a JSON object");
    }

    const nlohmann::json previous = store_.getAll();
    store_.update(patch);
    DetectionConfig updated;
    try
    {
        updated = snapshot();
    }
    catch (const ConfigurationError &e)
    {
        store_.loadFromString(previous.dump());
        Logger::warn("Rejected configuration update from " + source + ": " + e.what());
        throw;
    }

    ConfigUpdateEvent event;
    event.changed_keys = flattenKeys(patch);
    event.source = source;
    event.update_id = nextUpdateId();
    event.weight_table_id = updated.weight_table_id;
    Logger::info("Configuration updated from " + source + " (" + std::to_string(event.changed_keys.size()) +
                 " keys, weight table " + event.weight_table_id + ")");
    notifyObservers(event);
}

void DetectionConfigManager::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
        observers_.push_back(observer);
}

void DetectionConfigManager::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

std::vector<std::string> DetectionConfigManager::flattenKeys(const nlohmann::json &patch, const std::string &prefix)
{
    std::vector<std::string> keys;
    for (auto it = patch.begin(); it != patch.end(); ++it)
    {
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        if (it.value().is_object())
        {
            auto nested = flattenKeys(it.value(), key);
            keys.insert(keys.end(), nested.begin(), nested.end());
        }
        else
        {
            keys.push_back(key);
        }
    }
    return keys;
}

void DetectionConfigManager::notifyObservers(const ConfigUpdateEvent &event)
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
            Logger::error("Config observer failed on update " + event.update_id + ": " + e.what());
        }
    }
}
