#include <gtest/gtest.h>
#include "core/config.hpp"
#include "core/errors.hpp"
#include "test_fixtures.hpp"
#include <cstdlib>
#include <fstream>

using namespace vg;
using vg::testing::TempDataset;

TEST(ConfigTest, DefaultsNeedOnlyDataPath) {
    CorpusConfig config;
    std::string error;
    EXPECT_FALSE(config.validate(error));
    EXPECT_EQ(error, "Data path is required");

    config.data_path = "data";
    EXPECT_TRUE(config.validate(error));
    EXPECT_EQ(config.first_chapter, 1);
    EXPECT_EQ(config.last_chapter, kTotalChapters);
    EXPECT_DOUBLE_EQ(config.root_weight, 1.0);
    EXPECT_DOUBLE_EQ(config.lemma_weight, 0.5);
    EXPECT_DOUBLE_EQ(config.normalized_weight, 0.8);
}

TEST(ConfigTest, RejectsBadRanges) {
    CorpusConfig config;
    config.data_path = "data";
    std::string error;

    config.first_chapter = 0;
    EXPECT_FALSE(config.validate(error));

    config.first_chapter = 10;
    config.last_chapter = 5;
    EXPECT_FALSE(config.validate(error));

    config.last_chapter = 115;
    EXPECT_FALSE(config.validate(error));
}

TEST(ConfigTest, RejectsEmptyDelimiterAndBadWeights) {
    CorpusConfig config;
    config.data_path = "data";
    std::string error;

    config.delimiter = "";
    EXPECT_FALSE(config.validate(error));

    config.delimiter = " ";
    config.lemma_weight = 1.5;
    EXPECT_FALSE(config.validate(error));
}

TEST(ConfigTest, JsonFileRoundTrip) {
    TempDataset dir;
    std::string path = dir.path() + "/config.json";

    CorpusConfig config;
    config.data_path = "/data/chapters";
    config.file_prefix = "chapter_";
    config.first_chapter = 2;
    config.last_chapter = 7;
    config.normalization.fold_taa_marbuta = false;
    config.normalized_weight = 0.6;
    config.verbose = true;
    config.to_json_file(path);

    CorpusConfig loaded = CorpusConfig::from_json_file(path);
    EXPECT_EQ(loaded.data_path, "/data/chapters");
    EXPECT_EQ(loaded.file_prefix, "chapter_");
    EXPECT_EQ(loaded.first_chapter, 2);
    EXPECT_EQ(loaded.last_chapter, 7);
    EXPECT_FALSE(loaded.normalization.fold_taa_marbuta);
    EXPECT_DOUBLE_EQ(loaded.normalized_weight, 0.6);
    EXPECT_TRUE(loaded.verbose);
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(CorpusConfig::from_json_file("/nonexistent/config.json"), ConfigError);
}

TEST(ConfigTest, MalformedFileKeepsCause) {
    TempDataset dir;
    std::string path = dir.path() + "/config.json";
    std::ofstream(path) << "{ not json";

    try {
        CorpusConfig::from_json_file(path);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_THROW(std::rethrow_if_nested(e), nlohmann::json::parse_error);
    }
}

TEST(ConfigTest, WrongValueTypeThrows) {
    TempDataset dir;
    std::string path = dir.path() + "/config.json";
    std::ofstream(path) << R"({"first_chapter": "one"})";

    EXPECT_THROW(CorpusConfig::from_json_file(path), ConfigError);
}

TEST(ConfigTest, EnvironmentOverrides) {
    setenv("VG_DATA_PATH", "/env/data", 1);
    setenv("VG_FILE_PREFIX", "c", 1);
    setenv("VG_VERBOSE", "true", 1);

    CorpusConfig config = load_config_with_fallback();
    EXPECT_EQ(config.data_path, "/env/data");
    EXPECT_EQ(config.file_prefix, "c");
    EXPECT_TRUE(config.verbose);

    unsetenv("VG_DATA_PATH");
    unsetenv("VG_FILE_PREFIX");
    unsetenv("VG_VERBOSE");
}
