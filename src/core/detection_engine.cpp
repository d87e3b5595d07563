#include "core/detection_engine.hpp"
#include "core/detection_errors.hpp"
#include "core/metadata_analyzer.hpp"
#include "core/onnx_model_backend.hpp"
#include "core/pixel_forensics_analyzer.hpp"
#include "database/sqlite_document_store.hpp"
#include "database/sqlite_summary_store.hpp"
#include "logging/logger.hpp"
#include <chrono>

DetectionEngine::DetectionEngine(DetectionConfig config,
                                 std::shared_ptr<const ModelRegistry> registry,
                                 std::shared_ptr<ResultAssembler> assembler,
                                 std::vector<std::shared_ptr<const Analyzer>> extra_analyzers)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      assembler_(std::move(assembler))
{
    config_.validate();
    if (!registry_ || !registry_->isFrozen())
    {
        throw ConfigurationError("DetectionEngine requires a frozen model registry");
    }

    scorer_ = std::make_shared<ModelScorer>(registry_);
    aggregation_config_ = config_.aggregationConfig(registry_->version());

    std::vector<std::shared_ptr<const Analyzer>> analyzers;
    analyzers.push_back(std::make_shared<MetadataAnalyzer>());

    // Pixel signals are dispatched one task each
    PixelForensicsAnalyzer pixel(config_.forensics);
    for (const auto &signal : pixel.signals())
    {
        analyzers.push_back(signal);
    }

    for (const auto &model_id : registry_->listRegisteredModels())
    {
        analyzers.push_back(std::make_shared<ModelAnalyzer>(scorer_, model_id));
    }
    analyzers.insert(analyzers.end(), extra_analyzers.begin(), extra_analyzers.end());

    for (const auto &analyzer : analyzers)
    {
        for (const auto &method : analyzer->methods())
        {
            if (!aggregation_config_.weights.hasWeight(method))
            {
                Logger::warn("No weight configured for method " + method + ", using default weight " +
                             std::to_string(aggregation_config_.weights.defaultWeight()));
            }
        }
    }

    OrchestratorSettings settings;
    settings.max_workers = config_.max_workers;
    settings.timeout = std::chrono::milliseconds(config_.timeout_ms);
    settings.max_video_frames = config_.max_video_frames;
    orchestrator_ = std::make_unique<DetectionOrchestrator>(std::move(analyzers), settings);
}

std::unique_ptr<DetectionEngine> DetectionEngine::create(const DetectionConfig &config, bool with_persistence)
{
    config.validate();

    auto registry = std::make_shared<ModelRegistry>();
    OnnxModelBackend::registerAll(*registry, config.models);
    registry->freeze();

    std::shared_ptr<ResultAssembler> assembler;
    if (with_persistence)
    {
        assembler = std::make_shared<ResultAssembler>(std::make_shared<SqliteSummaryStore>(config.summary_db_path),
                                                      std::make_shared<SqliteDocumentStore>(config.detail_db_path),
                                                      config.max_retries);
    }
    return std::make_unique<DetectionEngine>(config, registry, assembler);
}

DetectionVerdict DetectionEngine::runDetection(const AnalysisInput &input, const CancellationToken &token)
{
    const auto start = std::chrono::steady_clock::now();
    Logger::info("Running detection on " + input.filename() + " (" + input.mimeType() + ", " +
                 std::to_string(input.bytes().size()) + " bytes)");

    std::vector<MethodOutcome> outcomes = orchestrator_->runAnalyses(input, token);
    DetectionVerdict verdict = EnsembleAggregator::aggregate(outcomes, aggregation_config_);

    const double elapsed_ms = std::chrono::duration<double, std::milli>(
                                  std::chrono::steady_clock::now() - start)
                                  .count();
    Logger::info("Detection of " + input.filename() + " finished in " + std::to_string(static_cast<long long>(elapsed_ms)) + "ms");
    return verdict.withProcessingTime(elapsed_ms);
}

PersistedDetection DetectionEngine::analyzeAndPersist(const AnalysisInput &input, const std::string &upload_reference,
                                                      const CancellationToken &token)
{
    if (!assembler_)
    {
        throw PersistenceFailure("persistence is not configured for this engine");
    }
    DetectionVerdict verdict = runDetection(input, token);
    ResultReference reference = assembler_->persist(verdict, upload_reference);
    return PersistedDetection{std::move(verdict), std::move(reference)};
}
