#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <map>

#include "../include/errors.hpp"
#include "../include/settings.hpp"
#include "test_support.hpp"

namespace {
const char* const kManagedVars[] = {
    "RAG_TABLE", "RAG_EMBED_DIMS", "RAG_PARTITION_INTERVAL", "RAG_LLM_PROVIDER", "RAG_MAX_RETRIES",
    "RAG_EMBED_PROVIDER", "RAG_EMBED_WORKERS", "RAG_LOG_LEVEL", "RAG_DB_PATH", "TIMESCALE_SERVICE_URL",
    "OPENAI_API_KEY", "OLLAMA_URL", "RAG_MAX_TOKENS", "OPENAI_MODEL", "OPENAI_BASE_URL", "OPENAI_EMBEDDING_MODEL",
    "RAG_LLM_MODEL", "RAG_EMBED_MODEL", "RAG_TEMPERATURE", "RAG_EMBED_QPS", "RAG_LLM_TIMEOUT_MS",
    "RAG_EMBED_TIMEOUT_MS",
};
}

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Save and clear the variables these tests depend on
        for (const char* key : kManagedVars) {
            if (const char* v = std::getenv(key)) saved_[key] = v;
            unsetenv(key);
        }
    }

    void TearDown() override {
        for (const char* key : kManagedVars) {
            auto it = saved_.find(key);
            if (it != saved_.end()) setenv(key, it->second.c_str(), 1);
            else unsetenv(key);
        }
    }

    std::string write_env(const std::string& text) {
        auto path = dir_.file(".env");
        {
            std::ofstream out(path);
            out << text;
        }
        return path.string();
    }

    TempDir dir_;
    std::map<std::string, std::string> saved_;
};

TEST_F(SettingsTest, DefaultsWithoutEnvFile) {
    auto s = load_settings(dir_.file("missing.env").string());
    EXPECT_EQ(s.vector_store.table_name, "embeddings");
    EXPECT_EQ(s.vector_store.embedding_dimensions, 1536);
    EXPECT_EQ(s.vector_store.time_partition_interval, std::chrono::hours(24 * 7));
    EXPECT_EQ(s.llm_provider, "openai");
    EXPECT_EQ(s.embed.provider, "openai");
    EXPECT_EQ(s.openai.default_model, "gpt-4o-mini");
    EXPECT_EQ(s.ollama.base_url, "http://localhost:11434");
    EXPECT_EQ(s.openai.max_retries, 3);
    EXPECT_FALSE(s.openai.max_tokens.has_value());
    EXPECT_EQ(s.log_level, LogLevel::Info);
}

TEST_F(SettingsTest, EnvFileValues) {
    auto path = write_env(
        "# local overrides\n"
        "export RAG_TABLE=faq_test\n"
        "RAG_EMBED_DIMS = 8\n"
        "RAG_PARTITION_INTERVAL=1d\n"
        "RAG_LLM_PROVIDER='ollama'\n"
        "RAG_MAX_RETRIES=5 # more patience\n"
        "RAG_MAX_TOKENS=512\n"
        "OLLAMA_URL=\"http://gpu-box:11434\"\n"
        "RAG_LOG_LEVEL=debug\n"
        "TIMESCALE_SERVICE_URL=sqlite:///tmp/faq.db\n");
    auto s = load_settings(path);
    EXPECT_EQ(s.vector_store.table_name, "faq_test");
    EXPECT_EQ(s.vector_store.embedding_dimensions, 8);
    EXPECT_EQ(s.vector_store.time_partition_interval, std::chrono::hours(24));
    EXPECT_EQ(s.llm_provider, "ollama");
    EXPECT_EQ(s.ollama.max_retries, 5);
    ASSERT_TRUE(s.ollama.max_tokens.has_value());
    EXPECT_EQ(*s.ollama.max_tokens, 512);
    EXPECT_EQ(s.ollama.base_url, "http://gpu-box:11434");
    EXPECT_EQ(s.log_level, LogLevel::Debug);
    EXPECT_EQ(s.database.service_url, "sqlite:///tmp/faq.db");
}

TEST_F(SettingsTest, ProcessEnvironmentWins) {
    auto path = write_env("RAG_TABLE=from_file\nRAG_EMBED_WORKERS=2\n");
    setenv("RAG_TABLE", "from_env", 1);
    auto s = load_settings(path);
    EXPECT_EQ(s.vector_store.table_name, "from_env");
    EXPECT_EQ(s.embed.workers, 2);
}

TEST_F(SettingsTest, BadNumbersAreRejected) {
    EXPECT_THROW(load_settings(write_env("RAG_EMBED_DIMS=lots\n")), InvalidArgument);
    EXPECT_THROW(load_settings(write_env("RAG_PARTITION_INTERVAL=weekly\n")), InvalidArgument);
}

TEST(DotenvTest, ParsesQuotesAndComments) {
    auto kv = parse_dotenv("A=1\n#B=2\n\nC = \"two words\"\nD='# not a comment'\nE=x # trailing\nnot a pair\n");
    EXPECT_EQ(kv.size(), 4u);
    EXPECT_EQ(kv["A"], "1");
    EXPECT_EQ(kv["C"], "two words");
    EXPECT_EQ(kv["D"], "# not a comment");
    EXPECT_EQ(kv["E"], "x");
    EXPECT_EQ(kv.count("B"), 0u);
}

TEST(IntervalTest, Units) {
    EXPECT_EQ(parse_interval("7d"), std::chrono::seconds(604800));
    EXPECT_EQ(parse_interval("12h"), std::chrono::seconds(43200));
    EXPECT_EQ(parse_interval("30m"), std::chrono::seconds(1800));
    EXPECT_EQ(parse_interval("45s"), std::chrono::seconds(45));
    EXPECT_EQ(parse_interval("90"), std::chrono::seconds(90));
    EXPECT_THROW(parse_interval("0d"), InvalidArgument);
    EXPECT_THROW(parse_interval("-1h"), InvalidArgument);
    EXPECT_THROW(parse_interval("1w"), InvalidArgument);
    EXPECT_THROW(parse_interval(""), InvalidArgument);
}
