#include "core/model_registry.hpp"
#include "core/detection_errors.hpp"
#include "logging/logger.hpp"
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

ModelPreprocessor::ModelPreprocessor(PreprocessingSpec spec)
    : spec_(spec)
{
    if (spec_.input_size <= 0)
    {
        throw ConfigurationError("model input_size must be positive");
    }
    for (int c = 0; c < 3; ++c)
    {
        if (!(spec_.std[c] > 0.0))
        {
            throw ConfigurationError("model normalization std must be positive");
        }
    }
}

cv::Mat ModelPreprocessor::toTensor(const cv::Mat &bgr) const
{
    if (bgr.empty())
    {
        throw AnalyzerFailure("cannot preprocess an empty frame");
    }

    const int size = spec_.input_size;
    cv::Mat resized;
    if (spec_.resize_to > 0)
    {
        // Shorter side to resize_to, then a centered input_size crop
        const double scale = static_cast<double>(spec_.resize_to) / std::min(bgr.cols, bgr.rows);
        const int width = std::max(size, static_cast<int>(std::lround(bgr.cols * scale)));
        const int height = std::max(size, static_cast<int>(std::lround(bgr.rows * scale)));
        cv::Mat scaled;
        cv::resize(bgr, scaled, cv::Size(width, height), 0, 0, cv::INTER_LINEAR);
        const cv::Rect crop((width - size) / 2, (height - size) / 2, size, size);
        resized = scaled(crop).clone();
    }
    else
    {
        cv::resize(bgr, resized, cv::Size(size, size), 0, 0, cv::INTER_LINEAR);
    }

    cv::Mat rgb, normalized;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(normalized, CV_32FC3, 1.0 / 255.0);
    cv::subtract(normalized, spec_.mean, normalized);
    cv::divide(normalized, spec_.std, normalized);

    // HWC -> NCHW [1, 3, size, size]
    return cv::dnn::blobFromImage(normalized);
}

void ModelRegistry::registerModel(const ModelDescriptor &descriptor, std::shared_ptr<const ModelBackend> backend)
{
    if (!backend)
    {
        throw ConfigurationError("model " + descriptor.id + " registered without a backend");
    }
    insert(RegisteredModel{descriptor, ModelPreprocessor(descriptor.preprocessing), std::move(backend), ""});
    Logger::info("Registered model " + descriptor.id + " (" + descriptor.display_name + ", version " + descriptor.version + ")");
}

void ModelRegistry::registerUnavailable(const ModelDescriptor &descriptor, const std::string &reason)
{
    insert(RegisteredModel{descriptor, ModelPreprocessor(descriptor.preprocessing), nullptr, reason});
    Logger::warn("Model " + descriptor.id + " registered as unavailable: " + reason);
}

void ModelRegistry::insert(RegisteredModel model)
{
    if (frozen_)
    {
        throw ConfigurationError("model registry is frozen; cannot register " + model.descriptor.id);
    }
    if (model.descriptor.id.empty())
    {
        throw ConfigurationError("model id must not be empty");
    }
    if (models_.count(model.descriptor.id) > 0)
    {
        throw ConfigurationError("model " + model.descriptor.id + " is already registered");
    }
    const std::string id = model.descriptor.id;
    models_.emplace(id, std::move(model));
    order_.push_back(id);
}

const RegisteredModel &ModelRegistry::get(const std::string &model_id) const
{
    auto it = models_.find(model_id);
    if (it == models_.end())
    {
        throw AnalyzerFailure("model " + model_id + " is not registered");
    }
    return it->second;
}

double ModelRegistry::invoke(const std::string &model_id, const cv::Mat &tensor) const
{
    const RegisteredModel &model = get(model_id);
    if (!model.available())
    {
        throw AnalyzerFailure("model " + model_id + " is unavailable: " + model.unavailable_reason);
    }

    const double probability = model.backend->invoke(tensor);
    if (!std::isfinite(probability) || probability < 0.0 || probability > 1.0)
    {
        throw AnalyzerFailure("model " + model_id + " returned invalid probability " + std::to_string(probability));
    }
    return probability;
}

std::string ModelRegistry::version() const
{
    if (order_.empty())
        return "none";
    std::string joined;
    for (const auto &id : order_)
    {
        if (!joined.empty())
            joined += ",";
        joined += id + "@" + models_.at(id).descriptor.version;
    }
    return joined;
}
