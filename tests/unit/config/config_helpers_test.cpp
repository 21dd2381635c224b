#include <gtest/gtest.h>
#include <ragrank/config/config_helpers.h>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace ragrank::config;

namespace fs = std::filesystem;

class ConfigHelpersTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("ragrank_helpers_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".toml");
        std::ofstream out(path_);
        out << "top.level = 1\n"
               "retrieval.rrf_k = 30\n"
               "\n"
               "[retrieval]\n"
               "default_top_k = 5 # trailing comment\n"
               "name = \"hash # kept\"\n"
               "\n"
               "[cache]\n"
               "max_entries = 7\n";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    fs::path path_;
};

TEST_F(ConfigHelpersTest, ReadsSectionValues) {
    EXPECT_EQ(parse_config_value(path_, "retrieval", "default_top_k"), "5");
    EXPECT_EQ(parse_config_value(path_, "cache", "max_entries"), "7");
    EXPECT_EQ(parse_config_value(path_, "retrieval", "name"), "hash # kept");
}

TEST_F(ConfigHelpersTest, ReadsDottedTopLevelKeys) {
    EXPECT_EQ(parse_config_value(path_, "retrieval", "rrf_k"), "30");
}

TEST_F(ConfigHelpersTest, MissingKeyOrFileIsEmpty) {
    EXPECT_EQ(parse_config_value(path_, "cache", "default_top_k"), "");
    EXPECT_EQ(parse_config_value(path_.string() + ".missing", "cache", "max_entries"), "");
}

TEST(ConfigStringTest, TrimAndUnquote) {
    std::string s = "  padded \t";
    trim(s);
    EXPECT_EQ(s, "padded");
    EXPECT_EQ(unquote(" 'single' "), "single");
    EXPECT_EQ(unquote("\"double\""), "double");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
}

TEST(ConfigPathTest, OverrideWins) {
    EXPECT_EQ(get_config_path("/tmp/explicit.toml"), fs::path("/tmp/explicit.toml"));
}
