#include "core/model_scorer.hpp"
#include "core/detection_errors.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <iomanip>
#include <numeric>
#include <sstream>

ModelScorer::ModelScorer(std::shared_ptr<const ModelRegistry> registry)
    : registry_(std::move(registry))
{
    if (!registry_)
    {
        throw ConfigurationError("ModelScorer requires a model registry");
    }
}

MethodOutcome ModelScorer::score(const AnalysisInput &input, const std::string &model_id, int max_video_frames) const
{
    return score(AnalysisRequest::prepare(input, max_video_frames), model_id);
}

MethodOutcome ModelScorer::score(const AnalysisRequest &request, const std::string &model_id) const
{
    const auto start = std::chrono::steady_clock::now();
    MethodOutcome outcome;
    try
    {
        outcome = scoreUnguarded(request, model_id);
    }
    catch (const cv::Exception &e)
    {
        outcome = MethodOutcome::failed(model_id, std::string("inference error: ") + e.what());
    }
    catch (const std::exception &e)
    {
        outcome = MethodOutcome::failed(model_id, e.what());
    }
    outcome.processing_time_ms = std::chrono::duration<double, std::milli>(
                                     std::chrono::steady_clock::now() - start)
                                     .count();
    return outcome;
}

MethodOutcome ModelScorer::scoreUnguarded(const AnalysisRequest &request, const std::string &model_id) const
{
    const RegisteredModel &model = registry_->get(model_id);
    if (!model.available())
    {
        return MethodOutcome::failed(model_id, "model unavailable: " + model.unavailable_reason,
                                     {{"model_id", model_id}, {"version", model.descriptor.version}});
    }

    const DecodedMedia &media = request.media();
    std::vector<double> probabilities;
    for (const auto &frame : media.frames)
    {
        request.throwIfCancelled(model_id);
        const cv::Mat tensor = model.preprocessor.toTensor(frame);
        probabilities.push_back(registry_->invoke(model_id, tensor));
    }
    if (probabilities.empty())
    {
        throw AnalyzerFailure("no frames to score");
    }

    const double probability = std::accumulate(probabilities.begin(), probabilities.end(), 0.0) / probabilities.size();

    std::ostringstream summary;
    summary << model_id << ": " << model.descriptor.display_name << " estimates "
            << std::fixed << std::setprecision(1) << probability * 100.0 << "% probability of AI generation";
    if (probabilities.size() > 1)
        summary << " (mean of " << probabilities.size() << " frames)";

    nlohmann::json detail = {
        {"model_id", model_id},
        {"display_name", model.descriptor.display_name},
        {"version", model.descriptor.version},
        {"input_size", model.preprocessor.spec().input_size},
        {"probability", probability},
        {"frame_probabilities", probabilities}};

    return MethodOutcome::ok(model_id, probability, summary.str(), detail);
}

ModelAnalyzer::ModelAnalyzer(std::shared_ptr<const ModelScorer> scorer, std::string model_id)
    : scorer_(std::move(scorer)), model_id_(std::move(model_id))
{
}

std::vector<MethodOutcome> ModelAnalyzer::produce(const AnalysisRequest &request) const
{
    return {scorer_->score(request, model_id_)};
}
