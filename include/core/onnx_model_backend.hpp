#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/dnn.hpp>
#include "core/model_registry.hpp"

/**
 * @brief ModelBackend running an ONNX classifier through OpenCV DNN
 *
 * A single output logit is mapped through a sigmoid; two or more logits
 * through a softmax, reporting the probability of ai_class_index.
 */
class OnnxModelBackend : public ModelBackend
{
public:
    /**
     * @throws AnalyzerFailure when the file cannot be loaded
     */
    OnnxModelBackend(const std::string &model_path, int ai_class_index);

    double invoke(const cv::Mat &tensor) const override;

    /**
     * @brief Map raw network outputs to the AI-class probability
     * @throws AnalyzerFailure for empty outputs or an out-of-range class index
     */
    static double probabilityFromLogits(const std::vector<float> &logits, int ai_class_index);

    /**
     * @brief Load every enabled model into the registry
     *
     * Specs whose model file cannot be loaded are registered as unavailable.
     */
    static void registerAll(ModelRegistry &registry, const std::vector<ModelSpec> &specs);

private:
    mutable cv::dnn::Net net_;
    mutable std::mutex net_mutex_; // Net::forward mutates internal buffers
    int ai_class_index_;
    std::string model_path_;
};
