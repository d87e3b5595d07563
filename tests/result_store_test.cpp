#include "test_base.hpp"
#include "database/sqlite_document_store.hpp"
#include "database/sqlite_summary_store.hpp"

namespace
{
    SummaryRecord record(const std::string &key, const std::string &upload, const std::string &created_at)
    {
        SummaryRecord r;
        r.reference_key = key;
        r.upload_reference = upload;
        r.is_ai_generated = true;
        r.confidence_score = 0.7167;
        r.algorithm_version = "weights=v1-original;models=vit@1.0";
        r.processing_time_ms = 812.5;
        r.result_summary = "vit: high | metadata: no metadata present";
        r.created_at = created_at;

        MethodResultRow vit;
        vit.method_name = "vit";
        vit.status = "ok";
        vit.score = 0.92;
        vit.processing_time_ms = 140.0;
        MethodResultRow resnet;
        resnet.method_name = "resnet_nodown";
        resnet.status = "failed";
        resnet.reason = "model unavailable: models/resnet_nodown.onnx";
        r.methods = {vit, resnet};
        return r;
    }
}

class ResultStoreTest : public TestBase
{
};

TEST_F(ResultStoreTest, SummaryRoundTripsWithMethodRows)
{
    SqliteSummaryStore store(tempPath("summary.db"));
    ASSERT_TRUE(store.isReady());

    auto [result, key] = store.writeSummary(record("k1", "upload-1", "2024-05-01T10:00:00.000Z"));
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(key, "k1");

    auto stored = store.readSummary("k1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->upload_reference, "upload-1");
    EXPECT_TRUE(stored->is_ai_generated);
    EXPECT_DOUBLE_EQ(stored->confidence_score, 0.7167);
    EXPECT_EQ(stored->algorithm_version, "weights=v1-original;models=vit@1.0");
    EXPECT_EQ(stored->result_summary, "vit: high | metadata: no metadata present");
    ASSERT_EQ(stored->methods.size(), 2u);
    EXPECT_EQ(stored->methods[0].method_name, "vit");
    ASSERT_TRUE(stored->methods[0].score.has_value());
    EXPECT_DOUBLE_EQ(*stored->methods[0].score, 0.92);
    EXPECT_EQ(stored->methods[1].status, "failed");
    EXPECT_FALSE(stored->methods[1].score.has_value());
    EXPECT_EQ(stored->methods[1].reason, "model unavailable: models/resnet_nodown.onnx");
}

TEST_F(ResultStoreTest, UnknownKeyReadsNothing)
{
    SqliteSummaryStore store(tempPath("summary.db"));
    EXPECT_FALSE(store.readSummary("missing").has_value());
}

TEST_F(ResultStoreTest, SummariesAreAppendOnly)
{
    SqliteSummaryStore store(tempPath("summary.db"));
    ASSERT_TRUE(store.writeSummary(record("k1", "upload-1", "2024-05-01T10:00:00.000Z")).first.success);

    auto duplicate = record("k1", "upload-1", "2024-05-02T10:00:00.000Z");
    duplicate.confidence_score = 0.1;
    auto [result, key] = store.writeSummary(duplicate);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(key.empty());

    auto stored = store.readSummary("k1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_DOUBLE_EQ(stored->confidence_score, 0.7167);
    EXPECT_EQ(stored->methods.size(), 2u);
}

TEST_F(ResultStoreTest, HistoryIsOrderedByCreationTime)
{
    SqliteSummaryStore store(tempPath("summary.db"));
    ASSERT_TRUE(store.writeSummary(record("k2", "upload-1", "2024-05-02T10:00:00.000Z")).first.success);
    ASSERT_TRUE(store.writeSummary(record("k1", "upload-1", "2024-05-01T10:00:00.000Z")).first.success);
    ASSERT_TRUE(store.writeSummary(record("k3", "upload-2", "2024-05-01T09:00:00.000Z")).first.success);

    auto history = store.history("upload-1");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].reference_key, "k1");
    EXPECT_EQ(history[1].reference_key, "k2");
    EXPECT_TRUE(store.history("upload-3").empty());
}

TEST_F(ResultStoreTest, RejectsRecordWithoutKey)
{
    SqliteSummaryStore store(tempPath("summary.db"));
    EXPECT_FALSE(store.writeSummary(record("", "upload-1", "2024-05-01T10:00:00.000Z")).first.success);
}

TEST_F(ResultStoreTest, UnopenableDatabaseReportsFailures)
{
    SqliteSummaryStore store(tempPath("no/such/dir/summary.db"));
    EXPECT_FALSE(store.isReady());
    EXPECT_FALSE(store.writeSummary(record("k1", "upload-1", "2024-05-01T10:00:00.000Z")).first.success);

    SqliteDocumentStore documents(tempPath("no/such/dir/detail.db"));
    EXPECT_FALSE(documents.isReady());
    EXPECT_FALSE(documents.writeDetail("k1", {{"a", 1}}).success);
}

TEST_F(ResultStoreTest, DocumentRoundTripAndReplace)
{
    SqliteDocumentStore store(tempPath("detail.db"));
    ASSERT_TRUE(store.isReady());

    nlohmann::json document = {
        {"reference_key", "k1"},
        {"pixel_analysis", {{"ela", {{"score", 0.6}}}}},
        {"method_outcomes", nlohmann::json::array({{{"method_name", "vit"}, {"status", "ok"}}})}};
    ASSERT_TRUE(store.writeDetail("k1", document).success);

    auto stored = store.readDetail("k1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, document);

    document["pixel_analysis"]["ela"]["score"] = 0.7;
    ASSERT_TRUE(store.writeDetail("k1", document).success);
    EXPECT_DOUBLE_EQ((*store.readDetail("k1"))["pixel_analysis"]["ela"]["score"].get<double>(), 0.7);

    EXPECT_FALSE(store.readDetail("k2").has_value());
}

TEST_F(ResultStoreTest, StoresSurviveReopen)
{
    const auto summary_path = tempPath("summary.db");
    const auto detail_path = tempPath("detail.db");
    {
        SqliteSummaryStore summaries(summary_path);
        SqliteDocumentStore documents(detail_path);
        ASSERT_TRUE(summaries.writeSummary(record("k1", "upload-1", "2024-05-01T10:00:00.000Z")).first.success);
        ASSERT_TRUE(documents.writeDetail("k1", {{"reference_key", "k1"}}).success);
    }
    SqliteSummaryStore summaries(summary_path);
    SqliteDocumentStore documents(detail_path);
    EXPECT_TRUE(summaries.readSummary("k1").has_value());
    EXPECT_TRUE(documents.readDetail("k1").has_value());
}
