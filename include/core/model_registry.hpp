#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Model-specific resize and normalization parameters
 */
struct PreprocessingSpec
{
    int input_size = 224;                          // Square edge of the network input
    int resize_to = 0;                             // Shorter side before center crop; 0 resizes straight to input_size
    cv::Scalar mean = cv::Scalar(0.5, 0.5, 0.5);   // RGB order, applied after scaling to [0,1]
    cv::Scalar std = cv::Scalar(0.5, 0.5, 0.5);
};

/**
 * @brief Turns a BGR frame into the NCHW float tensor one model expects
 */
class ModelPreprocessor
{
public:
    explicit ModelPreprocessor(PreprocessingSpec spec);

    cv::Mat toTensor(const cv::Mat &bgr) const;
    const PreprocessingSpec &spec() const { return spec_; }

private:
    PreprocessingSpec spec_;
};

/**
 * @brief Inference capability of one model: tensor in, AI probability out
 */
class ModelBackend
{
public:
    virtual ~ModelBackend() = default;

    /**
     * @return Probability in [0,1] that the input is AI-generated
     * @throws AnalyzerFailure (or cv::Exception) when inference fails
     */
    virtual double invoke(const cv::Mat &tensor) const = 0;
};

struct ModelDescriptor
{
    std::string id;           // method name reported in outcomes, e.g. "vit"
    std::string display_name;
    std::string version;
    PreprocessingSpec preprocessing;
};

/**
 * @brief Configured model before loading: descriptor plus where its weights live
 */
struct ModelSpec
{
    ModelDescriptor descriptor;
    std::string path;
    int ai_class_index = 1;
    bool enabled = true;
};

struct RegisteredModel
{
    ModelDescriptor descriptor;
    ModelPreprocessor preprocessor;
    std::shared_ptr<const ModelBackend> backend; // null when unavailable
    std::string unavailable_reason;

    bool available() const { return backend != nullptr; }
};

/**
 * @brief Fixed set of classifiers known to the engine
 *
 * Models are registered during start-up and the registry is then frozen.
 * After freeze() the registry is read-only and safe for concurrent reads
 * without locking.
 */
class ModelRegistry
{
public:
    ModelRegistry() = default;
    ModelRegistry(const ModelRegistry &) = delete;
    ModelRegistry &operator=(const ModelRegistry &) = delete;

    /**
     * @throws ConfigurationError when frozen or when the id is already taken
     */
    void registerModel(const ModelDescriptor &descriptor, std::shared_ptr<const ModelBackend> backend);

    /**
     * @brief Keep a model listed whose backend could not be created; it reports failed outcomes
     */
    void registerUnavailable(const ModelDescriptor &descriptor, const std::string &reason);

    void freeze() { frozen_ = true; }
    bool isFrozen() const { return frozen_; }

    std::vector<std::string> listRegisteredModels() const { return order_; }
    bool contains(const std::string &model_id) const { return models_.count(model_id) > 0; }

    /**
     * @throws AnalyzerFailure for unknown ids
     */
    const RegisteredModel &get(const std::string &model_id) const;

    /**
     * @brief Run one model on a preprocessed tensor
     * @throws AnalyzerFailure if the model is unknown, unavailable or returns an invalid probability
     */
    double invoke(const std::string &model_id, const cv::Mat &tensor) const;

    /**
     * @brief Registry identity recorded in verdicts, e.g. "vit@1.0,resnet_nodown@1.0"
     */
    std::string version() const;

private:
    void insert(RegisteredModel model);

    std::map<std::string, RegisteredModel> models_;
    std::vector<std::string> order_;
    bool frozen_ = false;
};
