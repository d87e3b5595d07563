#include "core/ensemble_aggregator.hpp"
#include "core/detection_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>

namespace
{
    struct Contribution
    {
        const MethodOutcome *outcome;
        double weight;
        double weighted_score;
    };
}

DetectionVerdict EnsembleAggregator::aggregate(const std::vector<MethodOutcome> &outcomes, const AggregationConfig &config)
{
    if (!(config.decision_threshold >= 0.0 && config.decision_threshold <= 1.0))
    {
        throw ConfigurationError("decision threshold must be within [0,1]");
    }
    if (config.max_contributing_factors < 0)
    {
        throw ConfigurationError("max_contributing_factors must not be negative");
    }

    std::vector<Contribution> contributions;
    double weighted_sum = 0.0;
    double weight_sum = 0.0;
    for (const auto &outcome : outcomes)
    {
        if (!outcome.isOk() || !outcome.score)
            continue;
        const double weight = config.weights.weightFor(outcome.method_name);
        contributions.push_back({&outcome, weight, *outcome.score * weight});
        weighted_sum += *outcome.score * weight;
        weight_sum += weight;
    }

    if (contributions.empty())
    {
        Logger::warn("Aggregation failed: none of " + std::to_string(outcomes.size()) + " methods produced a score");
        throw InsufficientEvidence("no analyzer produced a usable score (" + std::to_string(outcomes.size()) +
                                   " methods failed or were skipped)");
    }
    if (weight_sum <= 0.0)
    {
        Logger::warn("Aggregation failed: all scored methods carry zero weight");
        throw InsufficientEvidence("all scored methods carry zero weight");
    }

    const double confidence = std::clamp(weighted_sum / weight_sum, 0.0, 1.0);
    const bool is_ai_generated = confidence >= config.decision_threshold;

    std::stable_sort(contributions.begin(), contributions.end(),
                     [](const Contribution &a, const Contribution &b)
                     {
                         if (a.weighted_score != b.weighted_score)
                             return a.weighted_score > b.weighted_score;
                         return a.outcome->method_name < b.outcome->method_name;
                     });

    std::vector<std::string> factors;
    for (const auto &contribution : contributions)
    {
        if (factors.size() >= static_cast<size_t>(config.max_contributing_factors))
            break;
        if (contribution.weight <= 0.0)
            continue;
        const MethodOutcome &outcome = *contribution.outcome;
        factors.push_back(outcome.summary.empty() ? outcome.method_name : outcome.summary);
    }

    Logger::info("Aggregated " + std::to_string(contributions.size()) + "/" + std::to_string(outcomes.size()) +
                 " methods: confidence " + std::to_string(confidence) +
                 (is_ai_generated ? " (AI-generated)" : " (authentic)"));

    return DetectionVerdict(is_ai_generated, confidence, std::move(factors), outcomes, algorithmVersion(config));
}

std::string EnsembleAggregator::algorithmVersion(const AggregationConfig &config)
{
    return "weights=" + config.weight_table_id + ";models=" + config.model_registry_version;
}
