#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/analyzer.hpp"
#include "core/model_registry.hpp"

/**
 * @brief Uniform scoring interface over the registered classifiers
 */
class ModelScorer
{
public:
    explicit ModelScorer(std::shared_ptr<const ModelRegistry> registry);

    /**
     * @brief Score one input with one model
     * @return ok outcome carrying the model probability, or failed when the
     *         model is unknown, unavailable or inference throws
     */
    MethodOutcome score(const AnalysisInput &input, const std::string &model_id, int max_video_frames = 8) const;

    /**
     * @brief Same as above on an already decoded request
     */
    MethodOutcome score(const AnalysisRequest &request, const std::string &model_id) const;

    const ModelRegistry &registry() const { return *registry_; }

private:
    MethodOutcome scoreUnguarded(const AnalysisRequest &request, const std::string &model_id) const;

    std::shared_ptr<const ModelRegistry> registry_;
};

/**
 * @brief Exposes one registered model as an Analyzer so it can be dispatched like any other
 */
class ModelAnalyzer : public Analyzer
{
public:
    ModelAnalyzer(std::shared_ptr<const ModelScorer> scorer, std::string model_id);

    std::string name() const override { return model_id_; }
    std::vector<std::string> methods() const override { return {model_id_}; }
    std::vector<MethodOutcome> produce(const AnalysisRequest &request) const override;

private:
    std::shared_ptr<const ModelScorer> scorer_;
    std::string model_id_;
};
