#pragma once

#include <string>
#include <vector>
#include "core/analysis_types.hpp"

/**
 * @brief Immutable parameters of one aggregation
 */
struct AggregationConfig
{
    MethodWeights weights;
    double decision_threshold = kDefaultDecisionThreshold;
    int max_contributing_factors = kDefaultMaxContributingFactors;
    std::string weight_table_id = "default";
    std::string model_registry_version = "none";
};

/**
 * @brief Combines method outcomes into one verdict by weighted mean
 *
 * Pure function of its arguments: identical outcomes and configuration
 * always give an identical verdict.
 */
class EnsembleAggregator
{
public:
    /**
     * @brief Aggregate the outcomes of one run
     * @param outcomes All outcomes of the run, including failed and skipped ones
     * @param config Weights, threshold and version identifiers
     * @return Verdict holding every outcome for audit
     * @throws InsufficientEvidence if no ok outcome with positive weight exists
     * @throws ConfigurationError if the threshold is outside [0,1] or the factor limit is negative
     */
    static DetectionVerdict aggregate(const std::vector<MethodOutcome> &outcomes, const AggregationConfig &config);

    static std::string algorithmVersion(const AggregationConfig &config);
};
