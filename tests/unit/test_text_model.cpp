#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/text_model.hpp"
#include <unordered_set>

using namespace vg;

// ==========================================
// Verse
// ==========================================

TEST(VerseTest, ValidConstruction) {
    Verse verse(1, 1, "بِسْمِ اللَّهِ الرَّحْمَٰنِ الرَّحِيمِ", 1);
    EXPECT_EQ(verse.chapter(), 1);
    EXPECT_EQ(verse.number(), 1);
    EXPECT_EQ(verse.sequence_number(), 1);
    EXPECT_EQ(verse.location(), std::make_pair(1, 1));
    EXPECT_EQ(verse.approximate_word_count(), 4u);
}

TEST(VerseTest, RejectsInvalidFields) {
    EXPECT_THROW(Verse(0, 1, "text"), DataValidationError);
    EXPECT_THROW(Verse(115, 1, "text"), DataValidationError);
    EXPECT_THROW(Verse(1, 0, "text"), DataValidationError);
    EXPECT_THROW(Verse(1, 1, ""), DataValidationError);
    EXPECT_THROW(Verse(1, 1, "text", 0), DataValidationError);
}

TEST(VerseTest, EqualityAndHash) {
    Verse a(2, 3, "text", 10);
    Verse b(2, 3, "text", 10);
    Verse c(2, 3, "text");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(std::hash<Verse>{}(a), std::hash<Verse>{}(b));
}

TEST(VerseTest, JsonOmitsAbsentSequence) {
    EXPECT_FALSE(Verse(1, 2, "text").to_json().contains("sequence_number"));
    EXPECT_EQ(Verse(1, 2, "text", 9).to_json()["sequence_number"], 9);
}

// ==========================================
// Chapter
// ==========================================

TEST(ChapterTest, ValidConstruction) {
    Chapter chapter(1, "الفاتحة", {Verse(1, 1, "a b"), Verse(1, 2, "c")},
                    std::string("Al-Faatiha"), std::string("Meccan"));

    EXPECT_EQ(chapter.verse_count(), 2u);
    EXPECT_EQ(chapter.approximate_word_count(), 3u);
    EXPECT_EQ(chapter.english_name(), "Al-Faatiha");

    const Verse* verse = chapter.find_verse(2);
    ASSERT_NE(verse, nullptr);
    EXPECT_EQ(verse->text(), "c");
    EXPECT_EQ(chapter.find_verse(3), nullptr);
}

TEST(ChapterTest, RejectsEmptyVerses) {
    EXPECT_THROW(Chapter(1, "name", {}), DataValidationError);
}

TEST(ChapterTest, RejectsOutOfRangeIndex) {
    EXPECT_THROW(Chapter(0, "name", {Verse(1, 1, "a")}), DataValidationError);
    EXPECT_THROW(Chapter(115, "name", {Verse(1, 1, "a")}), DataValidationError);
}

TEST(ChapterTest, RejectsForeignVerse) {
    EXPECT_THROW(Chapter(2, "name", {Verse(1, 1, "a")}), DataValidationError);
}

TEST(ChapterTest, JsonCarriesNullOptionalFields) {
    Chapter chapter(3, "name", {Verse(3, 1, "a")});
    auto j = chapter.to_json();
    EXPECT_TRUE(j["english_name"].is_null());
    EXPECT_TRUE(j["revelation_type"].is_null());
    EXPECT_EQ(j["verses"].size(), 1u);
    EXPECT_FALSE(chapter.to_json(false).contains("verses"));
}

// ==========================================
// Word
// ==========================================

TEST(WordTest, ValidConstruction) {
    Word word(1, 1, 0, "بِسْمِ", "بسم", "bisomi");
    EXPECT_EQ(word.location(), (WordLocation{1, 1, 0}));
    EXPECT_FALSE(word.root().has_value());
    EXPECT_FALSE(word.lemma().has_value());
    EXPECT_EQ(word.location().to_string(), "1:1:0");
}

TEST(WordTest, RejectsInvalidFields) {
    EXPECT_THROW(Word(0, 1, 0, "a", "a", "a"), DataValidationError);
    EXPECT_THROW(Word(1, 0, 0, "a", "a", "a"), DataValidationError);
    EXPECT_THROW(Word(1, 1, -1, "a", "a", "a"), DataValidationError);
    EXPECT_THROW(Word(1, 1, 0, "", "a", "a"), DataValidationError);
    EXPECT_THROW(Word(1, 1, 0, "a", "", "a"), DataValidationError);
    EXPECT_THROW(Word(1, 1, 0, "a", "a", ""), DataValidationError);
}

TEST(WordTest, LocationOrdering) {
    EXPECT_LT((WordLocation{1, 2, 5}), (WordLocation{1, 3, 0}));
    EXPECT_LT((WordLocation{1, 3, 0}), (WordLocation{2, 1, 0}));
    EXPECT_LT((WordLocation{2, 1, 0}), (WordLocation{2, 1, 1}));
}

TEST(WordTest, EqualityUsesAllFields) {
    Word a(1, 1, 0, "a", "a", "a", std::string("r"));
    Word b(1, 1, 0, "a", "a", "a", std::string("r"));
    Word c(1, 1, 0, "a", "a", "a");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);

    std::unordered_set<Word> set{a, b, c};
    EXPECT_EQ(set.size(), 2u);
}

TEST(WordTest, JsonIncludesRootAndLemmaOnlyWhenPresent) {
    Word bare(1, 1, 0, "a", "a", "a");
    EXPECT_FALSE(bare.to_json().contains("root"));
    EXPECT_FALSE(bare.to_json().contains("lemma"));

    Word annotated(1, 1, 0, "a", "a", "a", std::string("r"), std::string("l"));
    EXPECT_EQ(annotated.to_json()["root"], "r");
    EXPECT_EQ(annotated.to_json()["lemma"], "l");
}
