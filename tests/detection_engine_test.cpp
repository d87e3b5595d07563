#include "test_base.hpp"
#include "core/detection_engine.hpp"

class DetectionEngineTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        config = DetectionConfig::defaults();
        config.timeout_ms = 20000;
        config.max_workers = 4;
        config.weight_table_id = "test-table";
    }

    static std::shared_ptr<const ModelRegistry> fakeRegistry(bool resnet_available = true)
    {
        auto registry = std::make_shared<ModelRegistry>();
        registry->registerModel(testdata::descriptor("vit"), std::make_shared<testdata::FixedBackend>(0.92));
        if (resnet_available)
            registry->registerModel(testdata::descriptor("resnet_nodown", 224, 256), std::make_shared<testdata::FixedBackend>(0.88));
        else
            registry->registerUnavailable(testdata::descriptor("resnet_nodown", 224, 256), "model file not found: models/resnet_nodown.onnx");
        registry->freeze();
        return registry;
    }

    static AnalysisInput photo()
    {
        return AnalysisInput(testdata::encode(testdata::cameraLikeImage(), ".png"), "image/png", "photo.png");
    }

    DetectionConfig config;
};

TEST_F(DetectionEngineTest, ProducesVerdictFromAllMethods)
{
    DetectionEngine engine(config, fakeRegistry(), nullptr);
    EXPECT_EQ(engine.methods(), (std::vector<std::string>{"metadata", "prnu", "ela", "texture", "vit", "resnet_nodown"}));

    auto verdict = engine.runDetection(photo());
    ASSERT_EQ(verdict.methodOutcomes().size(), 6u);

    double weighted = 0.0;
    double total = 0.0;
    for (const auto &outcome : verdict.methodOutcomes())
    {
        ASSERT_TRUE(outcome.isOk()) << outcome.method_name << ": " << outcome.reason;
        const double weight = config.weights.at(outcome.method_name);
        weighted += weight * *outcome.score;
        total += weight;
    }
    EXPECT_NEAR(verdict.confidenceScore(), weighted / total, 1e-9);
    EXPECT_EQ(verdict.isAiGenerated(), verdict.confidenceScore() >= config.decision_threshold);
    EXPECT_EQ(verdict.algorithmVersion(), "weights=test-table;models=vit@test-1,resnet_nodown@test-1");
    EXPECT_GT(verdict.processingTimeMs(), 0.0);
    EXPECT_FALSE(verdict.contributingFactors().empty());
    EXPECT_DOUBLE_EQ(*verdict.findOutcome("vit")->score, 0.92);
}

TEST_F(DetectionEngineTest, UnavailableModelIsReportedNotFatal)
{
    DetectionEngine engine(config, fakeRegistry(false), nullptr);
    auto verdict = engine.runDetection(photo());

    const MethodOutcome *resnet = verdict.findOutcome("resnet_nodown");
    ASSERT_NE(resnet, nullptr);
    EXPECT_EQ(resnet->status, MethodStatus::FAILED);
    EXPECT_NE(resnet->reason.find("model unavailable"), std::string::npos);
    EXPECT_TRUE(verdict.findOutcome("vit")->isOk());
}

TEST_F(DetectionEngineTest, UndecodableUploadIsInsufficientEvidence)
{
    DetectionEngine engine(config, fakeRegistry(), nullptr);
    AnalysisInput garbage(std::vector<uint8_t>(256, 0x11), "image/jpeg", "garbage.jpg");
    EXPECT_THROW(engine.runDetection(garbage), InsufficientEvidence);
}

TEST_F(DetectionEngineTest, ExtraAnalyzersJoinTheEnsemble)
{
    auto frequency = std::make_shared<testdata::FixedAnalyzer>("frequency", 1.0);
    DetectionEngine engine(config, fakeRegistry(), nullptr, {frequency});

    auto verdict = engine.runDetection(photo());
    ASSERT_NE(verdict.findOutcome("frequency"), nullptr);
    EXPECT_EQ(frequency->invocations(), 1);
    EXPECT_EQ(verdict.methodOutcomes().size(), 7u);
}

TEST_F(DetectionEngineTest, CancelledRunProducesNoVerdict)
{
    DetectionEngine engine(config, fakeRegistry(), nullptr);
    CancellationToken token;
    token.cancel("upload withdrawn");
    EXPECT_THROW(engine.runDetection(photo(), token), DetectionCancelled);
}

TEST_F(DetectionEngineTest, AnalyzeAndPersistStoresVerdict)
{
    auto summaries = std::make_shared<testdata::MemorySummaryStore>();
    auto details = std::make_shared<testdata::MemoryDetailStore>();
    DetectionEngine engine(config, fakeRegistry(), std::make_shared<ResultAssembler>(summaries, details, 1));

    auto result = engine.analyzeAndPersist(photo(), "upload-1");
    EXPECT_TRUE(result.reference.detail_persisted);

    auto summary = summaries->readSummary(result.reference.reference_key);
    ASSERT_TRUE(summary.has_value());
    EXPECT_DOUBLE_EQ(summary->confidence_score, result.verdict.confidenceScore());
    EXPECT_EQ(summary->methods.size(), 6u);
    EXPECT_TRUE(details->readDetail(result.reference.reference_key).has_value());
}

TEST_F(DetectionEngineTest, PersistenceRequiresAssembler)
{
    DetectionEngine engine(config, fakeRegistry(), nullptr);
    EXPECT_THROW(engine.analyzeAndPersist(photo(), "upload-1"), PersistenceFailure);
}

TEST_F(DetectionEngineTest, RejectsUnfrozenRegistry)
{
    auto registry = std::make_shared<ModelRegistry>();
    EXPECT_THROW(DetectionEngine(config, registry, nullptr), ConfigurationError);
}

TEST_F(DetectionEngineTest, CreateRegistersMissingModelFilesAsUnavailable)
{
    config.models[0].path = tempPath("vit_detector.onnx");
    config.models[1].path = tempPath("resnet_nodown.onnx");
    auto engine = DetectionEngine::create(config, false);

    EXPECT_EQ(engine->registry().listRegisteredModels(), (std::vector<std::string>{"vit", "resnet_nodown"}));
    EXPECT_FALSE(engine->registry().get("vit").available());
    EXPECT_EQ(engine->assembler(), nullptr);

    // Forensic methods still carry the verdict
    auto verdict = engine->runDetection(photo());
    EXPECT_EQ(verdict.findOutcome("vit")->status, MethodStatus::FAILED);
    EXPECT_TRUE(verdict.findOutcome("metadata")->isOk());
}
