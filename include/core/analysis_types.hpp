#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Tunables shared by configuration and aggregation
constexpr double kDefaultMethodWeight = 1.0;
constexpr double kDefaultDecisionThreshold = 0.5;
constexpr int kDefaultMaxContributingFactors = 5;

/**
 * @brief Immutable description of the artifact under test
 *
 * The byte buffer is shared read-only between all concurrent analyzer invocations.
 */
class AnalysisInput
{
public:
    AnalysisInput(std::vector<uint8_t> bytes, std::string mime_type, std::string filename);

    const std::vector<uint8_t> &bytes() const { return *bytes_; }
    const std::string &mimeType() const { return mime_type_; }
    const std::string &filename() const { return filename_; }

    bool isImage() const;
    bool isVideo() const;

private:
    std::shared_ptr<const std::vector<uint8_t>> bytes_;
    std::string mime_type_;
    std::string filename_;
};

enum class MethodStatus
{
    OK,
    FAILED,
    SKIPPED
};

/**
 * @brief Result of one analyzer method invocation
 *
 * score is present (and within [0,1]) only when status is OK. Failed and skipped
 * outcomes carry a reason instead and are kept for audit.
 */
struct MethodOutcome
{
    std::string method_name;
    MethodStatus status = MethodStatus::FAILED;
    std::optional<double> score;
    std::string reason;           // Why the method failed or was skipped
    std::string summary;          // Human-readable explanation used for contributing factors
    nlohmann::json detail;        // Method-specific structured explanation
    double processing_time_ms = 0.0;

    bool isOk() const { return status == MethodStatus::OK; }

    /**
     * @brief Build a successful outcome
     * @throws AnalyzerFailure if score is not a finite value within [0,1]
     */
    static MethodOutcome ok(const std::string &method, double score, const std::string &summary,
                            nlohmann::json detail = nlohmann::json::object());
    static MethodOutcome failed(const std::string &method, const std::string &reason,
                                nlohmann::json detail = nlohmann::json::object());
    static MethodOutcome skipped(const std::string &method, const std::string &reason,
                                 nlohmann::json detail = nlohmann::json::object());
};

/**
 * @brief Non-negative weight per method name, normalized at combination time
 */
class MethodWeights
{
public:
    explicit MethodWeights(double default_weight = kDefaultMethodWeight);

    /**
     * @throws ConfigurationError on negative or non-finite weights
     */
    void setWeight(const std::string &method, double weight);

    double weightFor(const std::string &method) const;
    bool hasWeight(const std::string &method) const;
    double defaultWeight() const { return default_weight_; }
    const std::map<std::string, double> &entries() const { return weights_; }

private:
    std::map<std::string, double> weights_;
    double default_weight_;
};

/**
 * @brief Aggregate result of one analysis run. Never mutated after creation.
 */
class DetectionVerdict
{
public:
    DetectionVerdict(bool is_ai_generated,
                     double confidence_score,
                     std::vector<std::string> contributing_factors,
                     std::vector<MethodOutcome> method_outcomes,
                     std::string algorithm_version,
                     double processing_time_ms = 0.0);

    bool isAiGenerated() const { return is_ai_generated_; }
    double confidenceScore() const { return confidence_score_; }
    const std::vector<std::string> &contributingFactors() const { return contributing_factors_; }
    const std::vector<MethodOutcome> &methodOutcomes() const { return method_outcomes_; }
    const std::string &algorithmVersion() const { return algorithm_version_; }
    double processingTimeMs() const { return processing_time_ms_; }

    // Same verdict with the wall-clock time of the whole run recorded
    DetectionVerdict withProcessingTime(double processing_time_ms) const;

    const MethodOutcome *findOutcome(const std::string &method) const;

private:
    bool is_ai_generated_;
    double confidence_score_;
    std::vector<std::string> contributing_factors_;
    std::vector<MethodOutcome> method_outcomes_;
    std::string algorithm_version_;
    double processing_time_ms_;
};

std::string methodStatusName(MethodStatus status);
MethodStatus parseMethodStatus(const std::string &name);

nlohmann::json outcomeToJson(const MethodOutcome &outcome);
nlohmann::json verdictToJson(const DetectionVerdict &verdict);
