#include "test_base.hpp"
#include "core/metadata_analyzer.hpp"
#include "core/result_assembler.hpp"
#include "database/sqlite_document_store.hpp"
#include "database/sqlite_summary_store.hpp"

using testdata::okOutcome;

namespace
{
    // Serializes strictly, the way a store without a replacement policy would
    class StrictJsonDetailStore : public DetailStore
    {
    public:
        DBOpResult writeDetail(const std::string &key, const nlohmann::json &document) override
        {
            documents[key] = document.dump();
            return DBOpResult(true);
        }
        std::optional<nlohmann::json> readDetail(const std::string &key) override
        {
            auto it = documents.find(key);
            if (it == documents.end())
                return std::nullopt;
            return nlohmann::json::parse(it->second);
        }

        std::map<std::string, std::string> documents;
    };

    DetectionVerdict verdictWith(MethodOutcome outcome)
    {
        return DetectionVerdict(false, 0.3, {"metadata: camera"}, {std::move(outcome), okOutcome("vit", 0.2)},
                                "weights=v1-original;models=vit@1.0", 120.0);
    }
}

class ResultAssemblerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        summaries = std::make_shared<testdata::MemorySummaryStore>();
        details = std::make_shared<testdata::MemoryDetailStore>();
    }

    static DetectionVerdict verdict()
    {
        std::vector<MethodOutcome> outcomes = {
            okOutcome("metadata", 0.7),
            okOutcome("prnu", 0.65),
            okOutcome("ela", 0.6),
            MethodOutcome::skipped("texture", "no textured region to analyze (uniform frame)"),
            okOutcome("vit", 0.92),
            MethodOutcome::failed("resnet_nodown", "model unavailable: models/resnet_nodown.onnx")};
        return DetectionVerdict(true, 0.7175, {"vit: high", "metadata: no metadata present"}, outcomes,
                                "weights=v1-original;models=vit@1.0,resnet_nodown@1.0", 950.0);
    }

    std::shared_ptr<testdata::MemorySummaryStore> summaries;
    std::shared_ptr<testdata::MemoryDetailStore> details;
};

TEST_F(ResultAssemblerTest, PersistsSummaryThenDetail)
{
    ResultAssembler assembler(summaries, details, 1);
    auto reference = assembler.persist(verdict(), "upload-42");

    EXPECT_EQ(reference.reference_key.size(), 64u);
    EXPECT_TRUE(reference.detail_persisted);
    EXPECT_TRUE(reference.detail_error.empty());

    auto summary = summaries->readSummary(reference.reference_key);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->upload_reference, "upload-42");
    EXPECT_TRUE(summary->is_ai_generated);
    EXPECT_DOUBLE_EQ(summary->confidence_score, 0.7175);
    EXPECT_EQ(summary->result_summary, "vit: high | metadata: no metadata present");
    EXPECT_EQ(summary->methods.size(), 6u);
    EXPECT_EQ(summary->created_at.back(), 'Z');

    auto document = details->readDetail(reference.reference_key);
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ((*document)["reference_key"], reference.reference_key);
    EXPECT_EQ((*document)["created_at"], summary->created_at);
}

TEST_F(ResultAssemblerTest, SummaryFailurePreventsDetailWrite)
{
    summaries->failures_remaining = 10;
    ResultAssembler assembler(summaries, details, 2);

    EXPECT_THROW(assembler.persist(verdict(), "upload-42"), PersistenceFailure);
    EXPECT_EQ(summaries->writes, 2);
    EXPECT_EQ(details->writes, 0);
    EXPECT_TRUE(details->documents.empty());
}

TEST_F(ResultAssemblerTest, TransientSummaryFailureIsRetried)
{
    summaries->failures_remaining = 1;
    ResultAssembler assembler(summaries, details, 3);

    auto reference = assembler.persist(verdict(), "upload-42");
    EXPECT_EQ(summaries->writes, 2);
    EXPECT_TRUE(reference.detail_persisted);
}

TEST_F(ResultAssemblerTest, DetailFailureKeepsSummary)
{
    details->failures_remaining = 10;
    ResultAssembler assembler(summaries, details, 1);

    auto reference = assembler.persist(verdict(), "upload-42");
    EXPECT_FALSE(reference.detail_persisted);
    EXPECT_NE(reference.detail_error.find("simulated detail failure"), std::string::npos);
    EXPECT_TRUE(summaries->readSummary(reference.reference_key).has_value());
    EXPECT_FALSE(details->readDetail(reference.reference_key).has_value());

    details->failures_remaining = 0;
    auto retried = assembler.retryDetail(reference.reference_key, verdict());
    EXPECT_TRUE(retried.detail_persisted);
    EXPECT_TRUE(details->readDetail(reference.reference_key).has_value());
}

TEST_F(ResultAssemblerTest, RetryDetailRequiresSummary)
{
    ResultAssembler assembler(summaries, details, 1);
    EXPECT_THROW(assembler.retryDetail("0000", verdict()), PersistenceFailure);
}

TEST_F(ResultAssemblerTest, ReferenceKeysAreUnique)
{
    ResultAssembler assembler(summaries, details, 1);
    auto first = assembler.persist(verdict(), "upload-42");
    auto second = assembler.persist(verdict(), "upload-42");
    EXPECT_NE(first.reference_key, second.reference_key);
    EXPECT_EQ(summaries->history("upload-42").size(), 2u);
    EXPECT_NE(ResultAssembler::makeReferenceKey("u", "t"), ResultAssembler::makeReferenceKey("u", "t"));
}

TEST_F(ResultAssemblerTest, DetailDocumentGroupsMethodFamilies)
{
    auto document = ResultAssembler::buildDetailDocument(verdict(), "upload-42", "key", "2024-05-01T10:00:00.000Z");

    EXPECT_EQ(document["upload_reference"], "upload-42");
    EXPECT_TRUE(document["aggregated_results"]["is_ai_generated"].get<bool>());
    EXPECT_DOUBLE_EQ(document["aggregated_results"]["confidence_score"].get<double>(), 0.7175);
    EXPECT_EQ(document["aggregated_results"]["contributing_factors"].size(), 2u);

    ASSERT_EQ(document["method_outcomes"].size(), 6u);
    EXPECT_EQ(document["exif_data"]["method_name"], "metadata");
    EXPECT_TRUE(document["pixel_analysis"].contains("prnu"));
    EXPECT_TRUE(document["pixel_analysis"].contains("ela"));
    EXPECT_EQ(document["pixel_analysis"]["texture"]["status"], "skipped");
    EXPECT_TRUE(document["model_results"].contains("vit"));
    EXPECT_EQ(document["model_results"]["resnet_nodown"]["status"], "failed");
}

TEST_F(ResultAssemblerTest, WorksWithSqliteStores)
{
    auto summary_store = std::make_shared<SqliteSummaryStore>(tempPath("summary.db"));
    auto detail_store = std::make_shared<SqliteDocumentStore>(tempPath("detail.db"));
    ResultAssembler assembler(summary_store, detail_store, 1);

    auto reference = assembler.persist(verdict(), "upload-7");
    ASSERT_TRUE(reference.detail_persisted);
    auto summary = summary_store->readSummary(reference.reference_key);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->methods.size(), 6u);
    auto document = detail_store->readDetail(reference.reference_key);
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ((*document)["model_results"]["vit"]["score"], 0.92);
}

TEST_F(ResultAssemblerTest, RequiresBothStores)
{
    EXPECT_THROW(ResultAssembler(nullptr, details), ConfigurationError);
    EXPECT_THROW(ResultAssembler(summaries, nullptr), ConfigurationError);
}

TEST_F(ResultAssemblerTest, DetailDocumentCarriesElaImagePath)
{
    auto without = ResultAssembler::buildDetailDocument(verdict(), "upload-42", "key", "2024-05-01T10:00:00.000Z");
    ASSERT_TRUE(without["pixel_analysis"].contains("ela_image_path"));
    EXPECT_TRUE(without["pixel_analysis"]["ela_image_path"].is_null());

    auto ela = MethodOutcome::ok("ela", 0.6, "ela: uniform", {{"artifact_path", "/var/lib/aigen/ela/upload_ela_1.png"}});
    auto with = ResultAssembler::buildDetailDocument(verdictWith(ela), "upload-42", "key", "2024-05-01T10:00:00.000Z");
    EXPECT_EQ(with["pixel_analysis"]["ela_image_path"], "/var/lib/aigen/ela/upload_ela_1.png");
}

TEST_F(ResultAssemblerTest, Latin1MetadataIsPersisted)
{
    auto png = testdata::withPngText(testdata::encode(testdata::smoothImage(32, 32), ".png"),
                                     "Copyright", "\xA9 2024 Jos\xE9");
    const MetadataAnalyzer analyzer;
    auto outcome = analyzer.analyzeMetadata(AnalysisInput(png, "image/png", "holiday.png"));
    ASSERT_TRUE(outcome.isOk());

    auto summary_store = std::make_shared<SqliteSummaryStore>(tempPath("summary.db"));
    auto detail_store = std::make_shared<SqliteDocumentStore>(tempPath("detail.db"));
    ResultAssembler assembler(summary_store, detail_store, 1);

    auto reference = assembler.persist(verdictWith(outcome), "upload-9");
    ASSERT_TRUE(reference.detail_persisted) << reference.detail_error;
    auto document = detail_store->readDetail(reference.reference_key);
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ((*document)["exif_data"]["detail"]["fields"]["PNG:Copyright"], "\xC2\xA9 2024 Jos\xC3\xA9");
}

TEST_F(ResultAssemblerTest, InvalidUtf8FromAnalyzerDoesNotEscapePersist)
{
    auto outcome = MethodOutcome::ok("metadata", 0.3, "metadata: camera", {{"note", std::string("caf\xE9")}});

    auto strict = std::make_shared<StrictJsonDetailStore>();
    ResultAssembler strict_assembler(summaries, strict, 2);
    ResultReference reference;
    ASSERT_NO_THROW(reference = strict_assembler.persist(verdictWith(outcome), "upload-5"));
    EXPECT_FALSE(reference.detail_persisted);
    EXPECT_NE(reference.detail_error.find("detail document rejected"), std::string::npos);
    EXPECT_TRUE(summaries->readSummary(reference.reference_key).has_value());

    // The SQLite store replaces the invalid byte instead of failing
    auto detail_store = std::make_shared<SqliteDocumentStore>(tempPath("detail.db"));
    ResultAssembler assembler(summaries, detail_store, 1);
    auto stored = assembler.persist(verdictWith(outcome), "upload-5");
    ASSERT_TRUE(stored.detail_persisted) << stored.detail_error;
    auto document = detail_store->readDetail(stored.reference_key);
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ((*document)["exif_data"]["detail"]["note"], "caf\xEF\xBF\xBD");
}
