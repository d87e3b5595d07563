#include "core/onnx_model_backend.hpp"
#include "core/detection_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>

OnnxModelBackend::OnnxModelBackend(const std::string &model_path, int ai_class_index)
    : ai_class_index_(ai_class_index), model_path_(model_path)
{
    if (!std::filesystem::exists(model_path))
    {
        throw AnalyzerFailure("model file not found: " + model_path);
    }

    try
    {
        net_ = cv::dnn::readNetFromONNX(model_path);
    }
    catch (const cv::Exception &e)
    {
        throw AnalyzerFailure("failed to load ONNX model " + model_path + ": " + e.what());
    }
    if (net_.empty())
    {
        throw AnalyzerFailure("failed to load ONNX model " + model_path);
    }

    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    Logger::info("Loaded ONNX model: " + model_path);
}

double OnnxModelBackend::invoke(const cv::Mat &tensor) const
{
    cv::Mat output;
    {
        std::lock_guard<std::mutex> lock(net_mutex_);
        net_.setInput(tensor);
        output = net_.forward();
    }

    cv::Mat flat = output.reshape(1, 1);
    cv::Mat as_float;
    flat.convertTo(as_float, CV_32F);
    std::vector<float> logits(as_float.begin<float>(), as_float.end<float>());
    return probabilityFromLogits(logits, ai_class_index_);
}

double OnnxModelBackend::probabilityFromLogits(const std::vector<float> &logits, int ai_class_index)
{
    if (logits.empty())
    {
        throw AnalyzerFailure("model produced no output");
    }

    if (logits.size() == 1)
    {
        return 1.0 / (1.0 + std::exp(-static_cast<double>(logits.front())));
    }

    if (ai_class_index < 0 || static_cast<size_t>(ai_class_index) >= logits.size())
    {
        throw AnalyzerFailure("ai_class_index " + std::to_string(ai_class_index) + " out of range for " +
                              std::to_string(logits.size()) + " outputs");
    }

    const double max_logit = *std::max_element(logits.begin(), logits.end());
    double denominator = 0.0;
    for (float logit : logits)
    {
        denominator += std::exp(static_cast<double>(logit) - max_logit);
    }
    return std::exp(static_cast<double>(logits[ai_class_index]) - max_logit) / denominator;
}

void OnnxModelBackend::registerAll(ModelRegistry &registry, const std::vector<ModelSpec> &specs)
{
    for (const auto &spec : specs)
    {
        if (!spec.enabled)
        {
            Logger::info("Model " + spec.descriptor.id + " is disabled in configuration");
            continue;
        }
        try
        {
            registry.registerModel(spec.descriptor, std::make_shared<OnnxModelBackend>(spec.path, spec.ai_class_index));
        }
        catch (const AnalyzerFailure &e)
        {
            registry.registerUnavailable(spec.descriptor, e.what());
        }
    }
}
