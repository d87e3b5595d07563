#include "core/analysis_types.hpp"
#include "core/detection_errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace
{
    std::string lowercase(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

AnalysisInput::AnalysisInput(std::vector<uint8_t> bytes, std::string mime_type, std::string filename)
    : bytes_(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))),
      mime_type_(lowercase(std::move(mime_type))),
      filename_(std::move(filename))
{
}

bool AnalysisInput::isImage() const
{
    return mime_type_.rfind("image/", 0) == 0;
}

bool AnalysisInput::isVideo() const
{
    return mime_type_.rfind("video/", 0) == 0;
}

MethodOutcome MethodOutcome::ok(const std::string &method, double score, const std::string &summary,
                                nlohmann::json detail)
{
    if (!std::isfinite(score) || score < 0.0 || score > 1.0)
    {
        std::ostringstream msg;
        msg << "Method " << method << " produced out-of-range score " << score;
        throw AnalyzerFailure(msg.str());
    }

    MethodOutcome outcome;
    outcome.method_name = method;
    outcome.status = MethodStatus::OK;
    outcome.score = score;
    outcome.summary = summary;
    outcome.detail = std::move(detail);
    return outcome;
}

MethodOutcome MethodOutcome::failed(const std::string &method, const std::string &reason, nlohmann::json detail)
{
    MethodOutcome outcome;
    outcome.method_name = method;
    outcome.status = MethodStatus::FAILED;
    outcome.reason = reason;
    outcome.summary = method + " failed: " + reason;
    outcome.detail = std::move(detail);
    return outcome;
}

MethodOutcome MethodOutcome::skipped(const std::string &method, const std::string &reason, nlohmann::json detail)
{
    MethodOutcome outcome;
    outcome.method_name = method;
    outcome.status = MethodStatus::SKIPPED;
    outcome.reason = reason;
    outcome.summary = method + " skipped: " + reason;
    outcome.detail = std::move(detail);
    return outcome;
}

MethodWeights::MethodWeights(double default_weight)
    : default_weight_(default_weight)
{
    if (!std::isfinite(default_weight) || default_weight < 0.0)
    {
        throw ConfigurationError("Default method weight must be a non-negative number");
    }
}

void MethodWeights::setWeight(const std::string &method, double weight)
{
    if (!std::isfinite(weight) || weight < 0.0)
    {
        throw ConfigurationError("Weight for method '" + method + "' must be a non-negative number");
    }
    weights_[method] = weight;
}

double MethodWeights::weightFor(const std::string &method) const
{
    auto it = weights_.find(method);
    return it != weights_.end() ? it->second : default_weight_;
}

bool MethodWeights::hasWeight(const std::string &method) const
{
    return weights_.find(method) != weights_.end();
}

DetectionVerdict::DetectionVerdict(bool is_ai_generated,
                                   double confidence_score,
                                   std::vector<std::string> contributing_factors,
                                   std::vector<MethodOutcome> method_outcomes,
                                   std::string algorithm_version,
                                   double processing_time_ms)
    : is_ai_generated_(is_ai_generated),
      confidence_score_(confidence_score),
      contributing_factors_(std::move(contributing_factors)),
      method_outcomes_(std::move(method_outcomes)),
      algorithm_version_(std::move(algorithm_version)),
      processing_time_ms_(processing_time_ms)
{
}

DetectionVerdict DetectionVerdict::withProcessingTime(double processing_time_ms) const
{
    return DetectionVerdict(is_ai_generated_, confidence_score_, contributing_factors_,
                            method_outcomes_, algorithm_version_, processing_time_ms);
}

const MethodOutcome *DetectionVerdict::findOutcome(const std::string &method) const
{
    for (const auto &outcome : method_outcomes_)
    {
        if (outcome.method_name == method)
            return &outcome;
    }
    return nullptr;
}

std::string methodStatusName(MethodStatus status)
{
    switch (status)
    {
    case MethodStatus::OK:
        return "ok";
    case MethodStatus::FAILED:
        return "failed";
    case MethodStatus::SKIPPED:
        return "skipped";
    }
    return "failed";
}

MethodStatus parseMethodStatus(const std::string &name)
{
    if (name == "ok")
        return MethodStatus::OK;
    if (name == "skipped")
        return MethodStatus::SKIPPED;
    if (name == "failed")
        return MethodStatus::FAILED;
    throw std::invalid_argument("Unknown method status: " + name);
}

nlohmann::json outcomeToJson(const MethodOutcome &outcome)
{
    nlohmann::json j;
    j["method_name"] = outcome.method_name;
    j["status"] = methodStatusName(outcome.status);
    if (outcome.score)
        j["score"] = *outcome.score;
    else
        j["score"] = nullptr;
    if (!outcome.reason.empty())
        j["reason"] = outcome.reason;
    j["summary"] = outcome.summary;
    j["detail"] = outcome.detail.is_null() ? nlohmann::json::object() : outcome.detail;
    j["processing_time_ms"] = outcome.processing_time_ms;
    return j;
}

nlohmann::json verdictToJson(const DetectionVerdict &verdict)
{
    nlohmann::json outcomes = nlohmann::json::array();
    for (const auto &outcome : verdict.methodOutcomes())
    {
        outcomes.push_back(outcomeToJson(outcome));
    }

    nlohmann::json j;
    j["is_ai_generated"] = verdict.isAiGenerated();
    j["confidence_score"] = verdict.confidenceScore();
    j["contributing_factors"] = verdict.contributingFactors();
    j["method_outcomes"] = outcomes;
    j["algorithm_version"] = verdict.algorithmVersion();
    j["processing_time_ms"] = verdict.processingTimeMs();
    return j;
}
