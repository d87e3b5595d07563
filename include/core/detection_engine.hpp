#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/analyzer.hpp"
#include "core/cancellation_token.hpp"
#include "core/detection_config.hpp"
#include "core/detection_orchestrator.hpp"
#include "core/ensemble_aggregator.hpp"
#include "core/model_registry.hpp"
#include "core/model_scorer.hpp"
#include "core/result_assembler.hpp"

struct PersistedDetection
{
    DetectionVerdict verdict;
    ResultReference reference;
};

/**
 * @brief Entry point of the detection core
 *
 * Wires the analyzers (metadata, the three pixel signals and one per
 * registered model) into an orchestrator, aggregates their outcomes and
 * optionally persists the verdict.
 */
class DetectionEngine
{
public:
    /**
     * @param registry Frozen model registry
     * @param assembler Persistence adapter; null disables analyzeAndPersist
     * @param extra_analyzers Additional evidence sources dispatched with the built-in ones
     * @throws ConfigurationError on invalid configuration or an unfrozen registry
     */
    DetectionEngine(DetectionConfig config,
                    std::shared_ptr<const ModelRegistry> registry,
                    std::shared_ptr<ResultAssembler> assembler,
                    std::vector<std::shared_ptr<const Analyzer>> extra_analyzers = {});

    /**
     * @brief Build an engine from configuration: ONNX models and SQLite stores
     */
    static std::unique_ptr<DetectionEngine> create(const DetectionConfig &config, bool with_persistence = true);

    /**
     * @brief Analyze one input and return its verdict
     * @throws InsufficientEvidence when no method produced a usable score
     * @throws DetectionCancelled when the caller cancels before aggregation
     */
    DetectionVerdict runDetection(const AnalysisInput &input, const CancellationToken &token = CancellationToken());

    /**
     * @brief runDetection followed by persistence of the verdict
     * @throws PersistenceFailure when the summary cannot be stored or persistence is disabled
     */
    PersistedDetection analyzeAndPersist(const AnalysisInput &input, const std::string &upload_reference,
                                         const CancellationToken &token = CancellationToken());

    std::vector<std::string> methods() const { return orchestrator_->dispatchedMethods(); }
    const DetectionConfig &config() const { return config_; }
    const ModelRegistry &registry() const { return *registry_; }
    ResultAssembler *assembler() const { return assembler_.get(); }

private:
    DetectionConfig config_;
    std::shared_ptr<const ModelRegistry> registry_;
    std::shared_ptr<const ModelScorer> scorer_;
    std::shared_ptr<ResultAssembler> assembler_;
    AggregationConfig aggregation_config_;
    std::unique_ptr<DetectionOrchestrator> orchestrator_;
};
