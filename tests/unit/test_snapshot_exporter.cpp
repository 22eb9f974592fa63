#include <gtest/gtest.h>
#include "core/corpus.hpp"
#include "core/errors.hpp"
#include "export/snapshot_exporter.hpp"
#include "test_fixtures.hpp"
#include <fstream>

using namespace vg;
using vg::testing::TempDataset;
using vg::testing::make_word;
using json = nlohmann::json;

class SnapshotExporterTest : public ::testing::Test {
protected:
    TempDataset dataset;
    TempDataset output;
    std::unique_ptr<Corpus> corpus;

    void SetUp() override {
        json first = TempDataset::chapter_document(1, {"بِسْمِ اللَّهِ", "الْحَمْدُ لِلَّهِ"}, "الفاتحة");
        first[kChapterEnglishNameKey] = "Al-Faatiha";
        first[kChapterCategoryKey] = "Meccan";
        dataset.write_json(1, first);
        dataset.write_chapter(2, {"الم"});

        CorpusConfig config;
        config.data_path = dataset.path();
        config.last_chapter = 2;

        corpus = std::make_unique<Corpus>(config);
        corpus->build();
    }

    json read(const std::string& path) const {
        std::ifstream in(path);
        return json::parse(in);
    }
};

TEST_F(SnapshotExporterTest, RequiresBuiltCorpus) {
    CorpusConfig config;
    config.data_path = dataset.path();
    Corpus unbuilt(config);
    EXPECT_THROW(SnapshotExporter{unbuilt}, CorpusStateError);
}

TEST_F(SnapshotExporterTest, Metadata) {
    auto metadata = SnapshotExporter(*corpus).metadata();
    EXPECT_EQ(metadata["format_version"], kExportFormatVersion);
    EXPECT_EQ(metadata["total_chapters"], 2);
    EXPECT_EQ(metadata["total_verses"], 3);
    EXPECT_EQ(metadata["total_words"], 5);

    std::string timestamp = metadata["export_timestamp"].get<std::string>();
    EXPECT_EQ(timestamp.size(), 20u);
    EXPECT_EQ(timestamp.back(), 'Z');
}

TEST_F(SnapshotExporterTest, WordListFields) {
    std::vector<Word> words = {
        make_word(1, 1, 0, "a", std::string("r")),
        make_word(1, 1, 1, "b")
    };

    auto full = SnapshotExporter::word_list(words);
    ASSERT_EQ(full.size(), 2u);
    EXPECT_EQ(full[0]["chapter"], 1);
    EXPECT_EQ(full[0]["position"], 0);
    EXPECT_EQ(full[0]["transliteration"], "a");
    EXPECT_EQ(full[0]["root"], "r");
    EXPECT_FALSE(full[1].contains("root"));
    EXPECT_FALSE(full[1].contains("lemma"));

    WordFields text_only{false, true, false, false};
    auto narrow = SnapshotExporter::word_list(words, text_only);
    EXPECT_FALSE(narrow[0].contains("chapter"));
    EXPECT_FALSE(narrow[0].contains("normalized"));
    EXPECT_EQ(narrow[0]["text"], "a");
    EXPECT_EQ(narrow[0]["root"], "r");
}

TEST_F(SnapshotExporterTest, FullSnapshotWithoutWords) {
    std::string path = output.path() + "/nested/dir/snapshot.json";
    SnapshotExporter(*corpus).export_full_snapshot(path);

    auto snapshot = read(path);
    EXPECT_EQ(snapshot["metadata"]["total_words"], 5);
    EXPECT_EQ(snapshot["word_counts_by_chapter"]["1"], 4);
    EXPECT_EQ(snapshot["word_counts_by_chapter"]["2"], 1);
    EXPECT_FALSE(snapshot.contains("words"));
}

TEST_F(SnapshotExporterTest, FullSnapshotWithWords) {
    std::string path = output.path() + "/snapshot.json";
    SnapshotExporter(*corpus).export_full_snapshot(path, true);

    auto snapshot = read(path);
    ASSERT_EQ(snapshot["words"].size(), 5u);
    EXPECT_EQ(snapshot["words"][0]["text"], "بِسْمِ");
    EXPECT_EQ(snapshot["words"][0]["normalized"], "بسم");
}

TEST_F(SnapshotExporterTest, ChapterSummary) {
    std::string path = output.path() + "/chapter_1.json";
    SnapshotExporter(*corpus).export_chapter_summary(1, path);

    auto summary = read(path);
    EXPECT_EQ(summary["chapter_number"], 1);
    EXPECT_EQ(summary["chapter_name"], "الفاتحة");
    EXPECT_EQ(summary["english_name"], "Al-Faatiha");
    EXPECT_EQ(summary["revelation_type"], "Meccan");
    EXPECT_EQ(summary["verse_count"], 2);
    EXPECT_EQ(summary["word_count"], 4);
    EXPECT_EQ(summary["words"].size(), 4u);
}

TEST_F(SnapshotExporterTest, ChapterSummaryNullOptionalFields) {
    std::string path = output.path() + "/chapter_2.json";
    SnapshotExporter(*corpus).export_chapter_summary(2, path);

    auto summary = read(path);
    EXPECT_TRUE(summary["english_name"].is_null());
    EXPECT_TRUE(summary["revelation_type"].is_null());
}

TEST_F(SnapshotExporterTest, UnknownChapterThrows) {
    EXPECT_THROW(SnapshotExporter(*corpus).export_chapter_summary(7, output.path() + "/x.json"),
                 ExportError);
}

TEST_F(SnapshotExporterTest, FilteredWords) {
    std::string path = output.path() + "/filtered.json";
    auto words = corpus->filter_words().by_text("لله", true).get();
    SnapshotExporter(*corpus).export_filtered_words(words, path, "lillah");

    auto document = read(path);
    EXPECT_EQ(document["metadata"]["word_count"], 1);
    EXPECT_EQ(document["metadata"]["description"], "lillah");
    EXPECT_EQ(document["words"][0]["verse"], 2);
}

TEST_F(SnapshotExporterTest, UnwritablePathThrowsWithCause) {
    // A regular file where a directory is needed
    std::string blocker = output.path() + "/blocker";
    std::ofstream(blocker) << "x";

    try {
        SnapshotExporter(*corpus).export_full_snapshot(blocker + "/snapshot.json");
        FAIL() << "Expected ExportError";
    } catch (const ExportError& e) {
        EXPECT_NE(describe_exception(e).find("Failed to create directory"), std::string::npos);
    }
}
