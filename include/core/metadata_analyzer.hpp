#pragma once

#include <ctime>
#include <regex>
#include <string>
#include <vector>
#include "core/analyzer.hpp"
#include "core/exif_reader.hpp"

/**
 * @brief Suspicion increments applied per fired indicator; the sum is clamped to [0,1]
 */
struct MetadataScoringPolicy
{
    double no_metadata = 0.70;
    double missing_device = 0.25;
    double missing_exposure = 0.15;
    double missing_lens = 0.05;
    double missing_geolocation = 0.05;
    double generator_software = 0.90;
    double generation_parameters = 0.90;
    double implausible_timestamp = 0.20;
    double unrealistic_exposure = 0.15;
    double zero_gps = 0.10;

    // Case-insensitive patterns matched against software/creator fields
    std::vector<std::string> generator_patterns = {
        R"(stable\s*diffusion)", R"(dall\s*[- ]?e)", R"(midjourney)", R"(generative)",
        R"(\bgan\b)", R"(neural)", R"(deep\s*dream)", R"(ai\s*image)", R"(openai)",
        R"(firefly)", R"(comfyui)", R"(novelai)", R"(imagen)", R"(automatic1111)"};
};

/**
 * @brief One fired indicator with the increment it contributed
 */
struct MetadataIndicator
{
    std::string id;   // stable key, e.g. "no_metadata"
    std::string fact; // human-readable description
    double increment;
};

struct MetadataAssessment
{
    double score = 0.0;
    std::vector<MetadataIndicator> indicators;
};

/**
 * @brief Scores forensic suspicion from embedded file metadata
 *
 * Reports a single "metadata" outcome. Corrupt or unsupported containers give
 * a failed outcome; video inputs are skipped.
 */
class MetadataAnalyzer : public Analyzer
{
public:
    static constexpr const char *kMethodName = "metadata";

    explicit MetadataAnalyzer(MetadataScoringPolicy policy = MetadataScoringPolicy());

    std::string name() const override { return kMethodName; }
    std::vector<std::string> methods() const override { return {kMethodName}; }
    std::vector<MethodOutcome> produce(const AnalysisRequest &request) const override;

    /**
     * @brief Extract and score metadata of one input; never throws for extraction errors
     */
    MethodOutcome analyzeMetadata(const AnalysisInput &input) const;

    /**
     * @brief Apply the scoring policy to already-extracted metadata
     * @param now Reference time for future-timestamp checks
     */
    MetadataAssessment assess(const EmbeddedMetadata &metadata, std::time_t now) const;

private:
    MetadataScoringPolicy policy_;
    std::vector<std::regex> generator_patterns_;

    void checkTimestamps(const EmbeddedMetadata &metadata, std::time_t now, MetadataAssessment &assessment) const;
    void checkExposureValues(const EmbeddedMetadata &metadata, MetadataAssessment &assessment) const;
    void checkGenerator(const EmbeddedMetadata &metadata, MetadataAssessment &assessment) const;
};
