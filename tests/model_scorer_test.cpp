#include "test_base.hpp"
#include "core/model_scorer.hpp"
#include "core/onnx_model_backend.hpp"
#include <cmath>

class ModelScorerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        vit_backend = std::make_shared<testdata::FixedBackend>(0.92);
        auto registry = std::make_shared<ModelRegistry>();
        registry->registerModel(testdata::descriptor("vit"), vit_backend);
        registry->registerModel(testdata::descriptor("resnet_nodown", 224, 256), std::make_shared<testdata::FixedBackend>(0.88));
        registry->registerModel(testdata::descriptor("broken"), std::make_shared<testdata::ThrowingBackend>());
        registry->registerUnavailable(testdata::descriptor("missing"), "model file not found: models/missing.onnx");
        registry->freeze();
        this->registry = registry;
        scorer = std::make_shared<ModelScorer>(registry);
    }

    AnalysisInput image() const
    {
        return AnalysisInput(testdata::encode(testdata::cameraLikeImage(300, 200), ".png"), "image/png", "photo.png");
    }

    std::shared_ptr<testdata::FixedBackend> vit_backend;
    std::shared_ptr<const ModelRegistry> registry;
    std::shared_ptr<ModelScorer> scorer;
};

TEST_F(ModelScorerTest, ScoresWithRegisteredModel)
{
    auto outcome = scorer->score(image(), "vit");
    ASSERT_TRUE(outcome.isOk()) << outcome.reason;
    EXPECT_DOUBLE_EQ(*outcome.score, 0.92);
    EXPECT_EQ(outcome.method_name, "vit");
    EXPECT_EQ(outcome.detail["model_id"], "vit");
    EXPECT_NE(outcome.summary.find("92.0% probability of AI generation"), std::string::npos);
    EXPECT_EQ(vit_backend->lastShape(), (std::vector<int>{1, 3, 224, 224}));
}

TEST_F(ModelScorerTest, UnavailableModelReportsFailure)
{
    auto outcome = scorer->score(image(), "missing");
    EXPECT_EQ(outcome.status, MethodStatus::FAILED);
    EXPECT_NE(outcome.reason.find("model unavailable"), std::string::npos);
    EXPECT_NE(outcome.reason.find("models/missing.onnx"), std::string::npos);
}

TEST_F(ModelScorerTest, UnknownModelReportsFailure)
{
    auto outcome = scorer->score(image(), "clip");
    EXPECT_EQ(outcome.status, MethodStatus::FAILED);
    EXPECT_NE(outcome.reason.find("not registered"), std::string::npos);
}

TEST_F(ModelScorerTest, InferenceErrorReportsFailure)
{
    auto outcome = scorer->score(image(), "broken");
    EXPECT_EQ(outcome.status, MethodStatus::FAILED);
    EXPECT_NE(outcome.reason.find("simulated inference error"), std::string::npos);
}

TEST_F(ModelScorerTest, UndecodableInputReportsFailure)
{
    auto outcome = scorer->score(AnalysisInput(std::vector<uint8_t>(100, 7), "image/png", "bad.png"), "vit");
    EXPECT_EQ(outcome.status, MethodStatus::FAILED);
}

TEST_F(ModelScorerTest, ModelAnalyzerUsesModelIdAsMethod)
{
    ModelAnalyzer analyzer(scorer, "resnet_nodown");
    EXPECT_EQ(analyzer.methods(), std::vector<std::string>{"resnet_nodown"});
    auto outcomes = analyzer.analyze(image());
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_DOUBLE_EQ(*outcomes[0].score, 0.88);
}

TEST(ModelRegistryTest, ListsModelsInRegistrationOrder)
{
    ModelRegistry registry;
    registry.registerModel(testdata::descriptor("vit"), std::make_shared<testdata::FixedBackend>(0.5));
    registry.registerUnavailable(testdata::descriptor("resnet_nodown"), "not loaded");
    EXPECT_EQ(registry.listRegisteredModels(), (std::vector<std::string>{"vit", "resnet_nodown"}));
    EXPECT_EQ(registry.version(), "vit@test-1,resnet_nodown@test-1");
    EXPECT_TRUE(registry.contains("vit"));
    EXPECT_FALSE(registry.get("resnet_nodown").available());
}

TEST(ModelRegistryTest, RejectsDuplicatesAndLateRegistration)
{
    ModelRegistry registry;
    EXPECT_EQ(registry.version(), "none");
    registry.registerModel(testdata::descriptor("vit"), std::make_shared<testdata::FixedBackend>(0.5));
    EXPECT_THROW(registry.registerModel(testdata::descriptor("vit"), std::make_shared<testdata::FixedBackend>(0.5)),
                 ConfigurationError);
    EXPECT_THROW(registry.registerModel(testdata::descriptor(""), std::make_shared<testdata::FixedBackend>(0.5)),
                 ConfigurationError);
    registry.freeze();
    EXPECT_TRUE(registry.isFrozen());
    EXPECT_THROW(registry.registerModel(testdata::descriptor("clip"), std::make_shared<testdata::FixedBackend>(0.5)),
                 ConfigurationError);
}

TEST(ModelRegistryTest, RejectsInvalidProbabilities)
{
    ModelRegistry registry;
    registry.registerModel(testdata::descriptor("vit"), std::make_shared<testdata::FixedBackend>(1.5));
    registry.freeze();
    cv::Mat tensor;
    EXPECT_THROW(registry.invoke("vit", tensor), AnalyzerFailure);
}

TEST(ModelPreprocessorTest, CenterCropsAfterShorterSideResize)
{
    PreprocessingSpec spec;
    spec.input_size = 224;
    spec.resize_to = 256;
    ModelPreprocessor preprocessor(spec);

    cv::Mat tensor = preprocessor.toTensor(testdata::cameraLikeImage(400, 300));
    ASSERT_EQ(tensor.dims, 4);
    EXPECT_EQ(tensor.size[0], 1);
    EXPECT_EQ(tensor.size[1], 3);
    EXPECT_EQ(tensor.size[2], 224);
    EXPECT_EQ(tensor.size[3], 224);
    EXPECT_EQ(tensor.depth(), CV_32F);
}

TEST(ModelPreprocessorTest, NormalizesWithMeanAndStd)
{
    PreprocessingSpec spec;
    spec.input_size = 8;
    ModelPreprocessor preprocessor(spec);

    // White BGR frame: (1.0 - 0.5) / 0.5 = 1.0 on every channel
    cv::Mat tensor = preprocessor.toTensor(testdata::flatImage(16, 16, 255));
    const float *values = tensor.ptr<float>();
    for (size_t i = 0; i < tensor.total(); ++i)
    {
        EXPECT_NEAR(values[i], 1.0f, 1e-5f);
    }
}

TEST(ModelPreprocessorTest, RejectsInvalidSpecs)
{
    PreprocessingSpec spec;
    spec.input_size = 0;
    EXPECT_THROW(ModelPreprocessor{spec}, ConfigurationError);
    spec.input_size = 224;
    spec.std = cv::Scalar(0.5, 0.0, 0.5);
    EXPECT_THROW(ModelPreprocessor{spec}, ConfigurationError);
    EXPECT_THROW(ModelPreprocessor(PreprocessingSpec()).toTensor(cv::Mat()), AnalyzerFailure);
}

TEST(OnnxModelBackendTest, SingleLogitUsesSigmoid)
{
    EXPECT_NEAR(OnnxModelBackend::probabilityFromLogits({0.0f}, 0), 0.5, 1e-9);
    EXPECT_NEAR(OnnxModelBackend::probabilityFromLogits({2.0f}, 0), 1.0 / (1.0 + std::exp(-2.0)), 1e-6);
}

TEST(OnnxModelBackendTest, MultipleLogitsUseSoftmax)
{
    const double p = OnnxModelBackend::probabilityFromLogits({1.0f, 3.0f}, 1);
    EXPECT_NEAR(p, std::exp(3.0) / (std::exp(1.0) + std::exp(3.0)), 1e-6);
    EXPECT_THROW(OnnxModelBackend::probabilityFromLogits({1.0f, 3.0f}, 2), AnalyzerFailure);
    EXPECT_THROW(OnnxModelBackend::probabilityFromLogits({}, 0), AnalyzerFailure);
}

TEST(OnnxModelBackendTest, MissingFilesRegisterAsUnavailable)
{
    ModelSpec vit;
    vit.descriptor = testdata::descriptor("vit");
    vit.path = "/nonexistent/vit_detector.onnx";
    ModelSpec disabled;
    disabled.descriptor = testdata::descriptor("resnet_nodown");
    disabled.enabled = false;

    ModelRegistry registry;
    OnnxModelBackend::registerAll(registry, {vit, disabled});
    EXPECT_EQ(registry.listRegisteredModels(), std::vector<std::string>{"vit"});
    EXPECT_FALSE(registry.get("vit").available());
    EXPECT_NE(registry.get("vit").unavailable_reason.find("not found"), std::string::npos);
    EXPECT_THROW(OnnxModelBackend("/nonexistent/vit_detector.onnx", 1), AnalyzerFailure);
}
