#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "core/analysis_types.hpp"
#include "core/detection_errors.hpp"

TEST(MethodOutcomeTest, OkOutcomeCarriesScore)
{
    auto outcome = MethodOutcome::ok("ela", 0.42, "ela: uniform error levels");
    EXPECT_TRUE(outcome.isOk());
    ASSERT_TRUE(outcome.score.has_value());
    EXPECT_DOUBLE_EQ(*outcome.score, 0.42);
    EXPECT_TRUE(outcome.reason.empty());
}

TEST(MethodOutcomeTest, OkOutcomeRejectsOutOfRangeScores)
{
    EXPECT_THROW(MethodOutcome::ok("ela", 1.01, "x"), AnalyzerFailure);
    EXPECT_THROW(MethodOutcome::ok("ela", -0.1, "x"), AnalyzerFailure);
    EXPECT_THROW(MethodOutcome::ok("ela", std::numeric_limits<double>::quiet_NaN(), "x"), AnalyzerFailure);
    EXPECT_NO_THROW(MethodOutcome::ok("ela", 0.0, "x"));
    EXPECT_NO_THROW(MethodOutcome::ok("ela", 1.0, "x"));
}

TEST(MethodOutcomeTest, FailedAndSkippedHaveNoScore)
{
    auto failed = MethodOutcome::failed("vit", "model unavailable");
    EXPECT_EQ(failed.status, MethodStatus::FAILED);
    EXPECT_FALSE(failed.score.has_value());
    EXPECT_EQ(failed.reason, "model unavailable");

    auto skipped = MethodOutcome::skipped("metadata", "video input");
    EXPECT_EQ(skipped.status, MethodStatus::SKIPPED);
    EXPECT_FALSE(skipped.score.has_value());
    EXPECT_FALSE(skipped.isOk());
}

TEST(MethodStatusTest, NamesRoundTrip)
{
    for (auto status : {MethodStatus::OK, MethodStatus::FAILED, MethodStatus::SKIPPED})
    {
        EXPECT_EQ(parseMethodStatus(methodStatusName(status)), status);
    }
    EXPECT_THROW(parseMethodStatus("pending"), std::invalid_argument);
}

TEST(MethodWeightsTest, UnknownMethodsUseDefaultWeight)
{
    MethodWeights weights(1.0);
    weights.setWeight("ela", 0.2);
    EXPECT_DOUBLE_EQ(weights.weightFor("ela"), 0.2);
    EXPECT_DOUBLE_EQ(weights.weightFor("frequency"), 1.0);
    EXPECT_TRUE(weights.hasWeight("ela"));
    EXPECT_FALSE(weights.hasWeight("frequency"));
}

TEST(MethodWeightsTest, RejectsNegativeWeights)
{
    MethodWeights weights;
    EXPECT_THROW(weights.setWeight("ela", -0.5), ConfigurationError);
    EXPECT_THROW(weights.setWeight("ela", std::numeric_limits<double>::infinity()), ConfigurationError);
    EXPECT_THROW(MethodWeights(-1.0), ConfigurationError);
    EXPECT_NO_THROW(weights.setWeight("ela", 0.0));
}

TEST(AnalysisInputTest, ClassifiesMimeTypes)
{
    AnalysisInput image({1, 2, 3}, "IMAGE/JPEG", "a.jpg");
    EXPECT_TRUE(image.isImage());
    EXPECT_FALSE(image.isVideo());
    EXPECT_EQ(image.mimeType(), "image/jpeg");

    AnalysisInput video({1, 2, 3}, "video/mp4", "a.mp4");
    EXPECT_TRUE(video.isVideo());
    EXPECT_EQ(video.bytes().size(), 3u);
}

TEST(DetectionVerdictTest, SerializesEveryOutcome)
{
    std::vector<MethodOutcome> outcomes = {
        MethodOutcome::ok("vit", 0.9, "vit: high"),
        MethodOutcome::failed("resnet_nodown", "model unavailable: file missing")};
    DetectionVerdict verdict(true, 0.9, {"vit: high"}, outcomes, "weights=default;models=none", 12.5);

    auto json = verdictToJson(verdict);
    EXPECT_TRUE(json["is_ai_generated"].get<bool>());
    EXPECT_DOUBLE_EQ(json["confidence_score"].get<double>(), 0.9);
    ASSERT_EQ(json["method_outcomes"].size(), 2u);
    EXPECT_EQ(json["method_outcomes"][1]["status"], "failed");
    EXPECT_TRUE(json["method_outcomes"][1]["score"].is_null());
    EXPECT_EQ(json["method_outcomes"][1]["reason"], "model unavailable: file missing");
    EXPECT_EQ(json["algorithm_version"], "weights=default;models=none");

    ASSERT_NE(verdict.findOutcome("resnet_nodown"), nullptr);
    EXPECT_EQ(verdict.findOutcome("texture"), nullptr);
}

TEST(DetectionVerdictTest, WithProcessingTimeKeepsEverythingElse)
{
    DetectionVerdict verdict(false, 0.2, {"metadata: no lens information"},
                             {MethodOutcome::ok("metadata", 0.2, "metadata: no lens information")}, "v");
    auto timed = verdict.withProcessingTime(99.0);
    EXPECT_DOUBLE_EQ(timed.processingTimeMs(), 99.0);
    EXPECT_DOUBLE_EQ(timed.confidenceScore(), 0.2);
    EXPECT_EQ(timed.contributingFactors(), verdict.contributingFactors());
    EXPECT_DOUBLE_EQ(verdict.processingTimeMs(), 0.0);
}
