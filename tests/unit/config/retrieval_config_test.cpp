#include <gtest/gtest.h>
#include <ragrank/config/retrieval_config.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace ragrank;
using namespace ragrank::config;

namespace fs = std::filesystem;

class RetrievalConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("ragrank_config_test_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(dir_);
        ::unsetenv("RAGRANK_CONFIG");
        ::setenv("XDG_CONFIG_HOME", dir_.c_str(), 1);
    }

    void TearDown() override {
        for (const char* name : {"RAGRANK_CONFIG", "RAGRANK_DEFAULT_TOP_K", "RAGRANK_MMR_LAMBDA",
                                 "RAGRANK_CACHE_MAX_ENTRIES", "RAGRANK_LOG_LEVEL",
                                 "RAGRANK_PARALLEL_SCORING", "XDG_CONFIG_HOME"}) {
            ::unsetenv(name);
        }
        spdlog::set_level(spdlog::level::info);
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string writeConfig(const std::string& body, const std::string& name = "config.toml") {
        const auto path = dir_ / name;
        std::ofstream out(path);
        out << body;
        return path.string();
    }

    fs::path dir_;
};

TEST_F(RetrievalConfigTest, DefaultsWithoutConfigFile) {
    auto settings = loadRetrievalSettings();
    ASSERT_TRUE(settings) << settings.error().message;

    const auto& s = settings.value();
    EXPECT_TRUE(s.sourcePath.empty());
    EXPECT_EQ(s.retrieval.defaultTopK, 6u);
    EXPECT_EQ(s.retrieval.maxTopK, 20u);
    EXPECT_EQ(s.retrieval.overfetchFactor, 3u);
    EXPECT_EQ(s.retrieval.rerankCandidateCap, 10u);
    EXPECT_DOUBLE_EQ(s.retrieval.minSimilarityScore, 0.3);
    EXPECT_DOUBLE_EQ(s.retrieval.rrfK, 60.0);
    EXPECT_DOUBLE_EQ(s.retrieval.mmrLambda, 0.7);
    EXPECT_EQ(s.retrieval.embeddingDim, 384u);
    EXPECT_EQ(s.cache.maxEntries, 500u);
    EXPECT_EQ(s.cache.defaultTTL, std::chrono::hours(24));
    EXPECT_EQ(s.logLevel, "info");
}

TEST_F(RetrievalConfigTest, ReadsAllSections) {
    const auto path = writeConfig(R"(
# retrieval tuning
[retrieval]
default_top_k = 8
max_top_k = 30
min_similarity_score = 0.25  # lenient
mmr_lambda = 0.5
bm25_k1 = 1.2
rerank_timeout_ms = 1500
embed_timeout_ms = 750
parallel_scoring = false
embedding_dim = 768

[cache]
max_entries = 100
ttl_seconds = 60
enable_statistics = off

[logging]
level = "DEBUG"
)");

    auto settings = loadRetrievalSettings(path);
    ASSERT_TRUE(settings) << settings.error().message;

    const auto& s = settings.value();
    EXPECT_EQ(s.sourcePath, fs::path(path));
    EXPECT_EQ(s.retrieval.defaultTopK, 8u);
    EXPECT_EQ(s.retrieval.maxTopK, 30u);
    EXPECT_DOUBLE_EQ(s.retrieval.minSimilarityScore, 0.25);
    EXPECT_DOUBLE_EQ(s.retrieval.mmrLambda, 0.5);
    EXPECT_DOUBLE_EQ(s.retrieval.bm25.k1, 1.2);
    EXPECT_EQ(s.retrieval.rerankTimeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(s.retrieval.embedTimeout, std::chrono::milliseconds(750));
    EXPECT_FALSE(s.retrieval.enableParallelScoring);
    EXPECT_EQ(s.retrieval.embeddingDim, 768u);
    EXPECT_EQ(s.cache.maxEntries, 100u);
    EXPECT_EQ(s.cache.defaultTTL, std::chrono::seconds(60));
    EXPECT_FALSE(s.cache.enableStatistics);
    EXPECT_EQ(s.logLevel, "debug");
}

TEST_F(RetrievalConfigTest, DefaultLocationUnderXdgConfigHome) {
    fs::create_directories(dir_ / "ragrank");
    writeConfig("[retrieval]\ndefault_top_k = 4\n", "ragrank/config.toml");

    auto settings = loadRetrievalSettings();
    ASSERT_TRUE(settings);
    EXPECT_EQ(settings.value().retrieval.defaultTopK, 4u);
}

TEST_F(RetrievalConfigTest, ConfigPathFromEnvironment) {
    const auto path = writeConfig("[retrieval]\nmax_top_k = 12\n", "custom.toml");
    ::setenv("RAGRANK_CONFIG", path.c_str(), 1);

    auto settings = loadRetrievalSettings();
    ASSERT_TRUE(settings);
    EXPECT_EQ(settings.value().retrieval.maxTopK, 12u);
}

TEST_F(RetrievalConfigTest, EnvironmentOverridesFile) {
    const auto path = writeConfig("[retrieval]\ndefault_top_k = 8\nmmr_lambda = 0.5\n");
    ::setenv("RAGRANK_DEFAULT_TOP_K", "3", 1);
    ::setenv("RAGRANK_CACHE_MAX_ENTRIES", "42", 1);
    ::setenv("RAGRANK_LOG_LEVEL", "warn", 1);
    ::setenv("RAGRANK_PARALLEL_SCORING", "no", 1);

    auto settings = loadRetrievalSettings(path);
    ASSERT_TRUE(settings) << settings.error().message;
    EXPECT_EQ(settings.value().retrieval.defaultTopK, 3u);
    EXPECT_DOUBLE_EQ(settings.value().retrieval.mmrLambda, 0.5);
    EXPECT_EQ(settings.value().cache.maxEntries, 42u);
    EXPECT_EQ(settings.value().logLevel, "warn");
    EXPECT_FALSE(settings.value().retrieval.enableParallelScoring);
}

TEST_F(RetrievalConfigTest, MissingRequestedFileIsAnError) {
    auto settings = loadRetrievalSettings((dir_ / "nope.toml").string());
    ASSERT_FALSE(settings);
    EXPECT_EQ(settings.error().code, ErrorCode::InvalidConfiguration);
}

TEST_F(RetrievalConfigTest, RejectsMalformedValues) {
    for (const char* body : {"[retrieval]\ndefault_top_k = six\n",
                             "[retrieval]\ndefault_top_k = -1\n",
                             "[retrieval]\nmin_similarity_score = 0.3abc\n",
                             "[retrieval]\nparallel_scoring = maybe\n",
                             "[logging]\nlevel = loud\n"}) {
        auto settings = loadRetrievalSettings(writeConfig(body));
        ASSERT_FALSE(settings) << body;
        EXPECT_EQ(settings.error().code, ErrorCode::InvalidConfiguration) << body;
    }
}

TEST_F(RetrievalConfigTest, RejectsOutOfRangeValues) {
    for (const char* body : {"[retrieval]\ndefault_top_k = 25\n",
                             "[retrieval]\nmmr_lambda = 1.5\n",
                             "[cache]\nmax_entries = 0\n",
                             "[cache]\nttl_seconds = 0\n"}) {
        auto settings = loadRetrievalSettings(writeConfig(body));
        ASSERT_FALSE(settings) << body;
        EXPECT_EQ(settings.error().code, ErrorCode::InvalidConfiguration) << body;
    }
}

TEST_F(RetrievalConfigTest, InvalidEnvironmentOverrideIsAnError) {
    ::setenv("RAGRANK_MMR_LAMBDA", "high", 1);
    auto settings = loadRetrievalSettings();
    ASSERT_FALSE(settings);
    EXPECT_EQ(settings.error().code, ErrorCode::InvalidConfiguration);
}

TEST_F(RetrievalConfigTest, ParseLogLevelNames) {
    EXPECT_EQ(parseLogLevel("trace").value(), spdlog::level::trace);
    EXPECT_EQ(parseLogLevel("Warning").value(), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("err").value(), spdlog::level::err);
    EXPECT_EQ(parseLogLevel("off").value(), spdlog::level::off);
    EXPECT_FALSE(parseLogLevel("verbose"));
}

TEST_F(RetrievalConfigTest, ApplyLogLevelSetsDefaultLogger) {
    ASSERT_TRUE(applyLogLevel("error"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
    EXPECT_FALSE(applyLogLevel("bogus"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
}
