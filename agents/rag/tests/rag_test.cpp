#include <gtest/gtest.h>
#include <fstream>

#include "../include/errors.hpp"
#include "../include/rag.hpp"
#include "../include/util.hpp"
#include "test_support.hpp"

using json = nlohmann::json;

class RagPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        embedder_ = std::make_shared<KeywordEmbeddings>(32);
        DatabaseSettings db;
        db.service_url = ":memory:";
        VectorStoreSettings table;
        table.table_name = "faq";
        table.embedding_dimensions = 32;
        store_ = std::make_unique<VectorStore>(db, table, embedder_);
        embed_.workers = 2;
    }

    std::filesystem::path write_csv(const std::string& name, const std::string& text) {
        auto path = dir_.file(name);
        std::ofstream out(path);
        out << text;
        return path;
    }

    std::filesystem::path faq_csv() {
        return write_csv("faq.csv",
                         "question;answer;category\n"
                         "Do you ship internationally?;Yes, to 30 countries.;shipping\n"
                         "How do I return an item?;Use the returns portal within 30 days.;returns\n"
                         "\"Can I pay; later?\";Yes, with invoice.;payment\n");
    }

    TempDir dir_;
    std::shared_ptr<KeywordEmbeddings> embedder_;
    std::unique_ptr<VectorStore> store_;
    EmbedSettings embed_;
};

TEST_F(RagPipelineTest, LoadFaqCsvByHeaderName) {
    auto path = write_csv("reordered.csv", "category;question;answer\nbilling; Who bills? ;We do.\n");
    auto rows = load_faq_csv(path);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].category, "billing");
    EXPECT_EQ(rows[0].question, "Who bills?");
    EXPECT_EQ(rows[0].answer, "We do.");

    EXPECT_EQ(load_faq_csv(faq_csv()).at(2).question, "Can I pay; later?");
}

TEST_F(RagPipelineTest, LoadFaqCsvErrors) {
    EXPECT_THROW(load_faq_csv(write_csv("nohdr.csv", "q;a;c\nx;y;z\n")), InvalidArgument);
    EXPECT_THROW(load_faq_csv(write_csv("short.csv", "question;answer;category\nonly;two\n")), InvalidArgument);
    EXPECT_THROW(load_faq_csv(dir_.file("absent.csv")), InvalidArgument);
}

TEST_F(RagPipelineTest, PrepareRecordsShapesContentAndMetadata) {
    auto rows = load_faq_csv(faq_csv());
    TimeUuidGenerator ids;
    auto records = prepare_records(rows, *embedder_, ids, embed_);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].content, "Question: Do you ship internationally?\nAnswer: Yes, to 30 countries.");
    EXPECT_EQ(records[0].metadata["category"], "shipping");
    EXPECT_EQ(records[0].metadata["created_at"], format_iso8601(records[0].id.time()));
    EXPECT_EQ(records[0].embedding.size(), 32u);
    EXPECT_LT(records[0].id, records[1].id);
    EXPECT_LT(records[1].id, records[2].id);
}

TEST_F(RagPipelineTest, IngestBuildsTableAndIndex) {
    IngestOptions opts;
    opts.csv = faq_csv();
    EXPECT_EQ(rag_ingest(*store_, *embedder_, embed_, opts), 3);
    EXPECT_EQ(store_->count(), 3u);
    EXPECT_TRUE(store_->has_index());

    // Re-ingesting appends fresh ids unless the table is reset first.
    EXPECT_EQ(rag_ingest(*store_, *embedder_, embed_, opts), 3);
    EXPECT_EQ(store_->count(), 6u);
    opts.reset = true;
    opts.create_index = false;
    rag_ingest(*store_, *embedder_, embed_, opts);
    EXPECT_EQ(store_->count(), 3u);
    EXPECT_FALSE(store_->has_index());
}

TEST_F(RagPipelineTest, QueryRetrievesThenAnswers) {
    IngestOptions opts;
    opts.csv = faq_csv();
    rag_ingest(*store_, *embedder_, embed_, opts);

    ScriptedTransport http;
    http.push_chat(R"({"thought_process": ["returns row applies"],
                       "answer": "Use the returns portal within 30 days.",
                       "enough_context": "yes"})");
    Settings settings;
    settings.openai.api_key = "sk-test";
    LlmHub hub(make_llm_provider("openai", settings, http.transport()));
    Responder responder(hub);

    SearchOptions search;
    search.limit = 2;
    search.metadata_filter = json{{"category", "returns"}};
    auto res = rag_query(*store_, responder, "How do I return an item?", search);
    ASSERT_EQ(res.sources.size(), 1u);
    EXPECT_EQ(res.sources[0].record.metadata["category"], "returns");
    EXPECT_EQ(res.answer.enough_context, EnoughContext::Yes);

    auto sent = http.request_body(0)["messages"];
    EXPECT_NE(sent[2]["content"].get<std::string>().find("returns portal"), std::string::npos);
}
