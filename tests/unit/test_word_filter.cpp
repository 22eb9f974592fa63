#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/word_filter.hpp"
#include "test_fixtures.hpp"

using namespace vg;
using vg::testing::make_word;

class WordFilterTest : public ::testing::Test {
protected:
    std::vector<Word> words;

    void SetUp() override {
        words = {
            make_word(1, 1, 0, "بِسْمِ", std::string("سمو"), std::nullopt, "بسم"),
            make_word(1, 1, 1, "اللَّهِ", std::string("أله"), std::string("الله"), "الله"),
            make_word(1, 2, 0, "الْحَمْدُ", std::string("حمد"), std::nullopt, "الحمد"),
            make_word(1, 2, 1, "لِلَّهِ", std::string("أله"), std::string("الله"), "لله"),
            make_word(2, 1, 0, "الم"),
            make_word(2, 2, 0, "ذَٰلِكَ", std::nullopt, std::nullopt, "ذلك"),
            make_word(2, 2, 1, "الْكِتَابُ", std::string("كتب"), std::nullopt, "الكتاب")
        };
    }
};

TEST_F(WordFilterTest, ByChapter) {
    WordFilter filter(words);
    EXPECT_EQ(filter.by_chapter(1).count(), 4u);
    EXPECT_EQ(filter.by_chapter(2).count(), 3u);
    EXPECT_EQ(filter.by_chapter(3).count(), 0u);
}

TEST_F(WordFilterTest, ByVerse) {
    WordFilter filter(words);
    auto verse = filter.by_verse(2, 2).get();
    ASSERT_EQ(verse.size(), 2u);
    EXPECT_EQ(verse[0].text(), "ذَٰلِكَ");
}

TEST_F(WordFilterTest, InvalidBoundsThrow) {
    WordFilter filter(words);
    EXPECT_THROW(filter.by_chapter(0), FilterError);
    EXPECT_THROW(filter.by_chapter(115), FilterError);
    EXPECT_THROW(filter.by_verse(1, 0), FilterError);
    EXPECT_THROW(filter.by_verse(200, 1), FilterError);
}

TEST_F(WordFilterTest, ByTextExactAndNormalized) {
    WordFilter filter(words);
    EXPECT_EQ(filter.by_text("اللَّهِ").count(), 1u);
    EXPECT_EQ(filter.by_text("الله").count(), 0u);
    EXPECT_EQ(filter.by_text("الله", true).count(), 1u);
}

TEST_F(WordFilterTest, ByTextContains) {
    WordFilter filter(words);
    EXPECT_EQ(filter.by_text_contains("لله", true).count(), 2u);
    EXPECT_EQ(filter.by_text_contains("ال").count(), 4u);
}

TEST_F(WordFilterTest, ByRootAndLemmaSkipAbsentValues) {
    WordFilter filter(words);
    EXPECT_EQ(filter.by_root("أله").count(), 2u);
    EXPECT_EQ(filter.by_root("xyz").count(), 0u);
    EXPECT_EQ(filter.by_lemma("الله").count(), 2u);
}

TEST_F(WordFilterTest, ChainingNeverMutatesReceiver) {
    WordFilter all(words);
    WordFilter chapter_one = all.by_chapter(1);
    WordFilter narrowed = chapter_one.by_root("أله");

    EXPECT_EQ(all.count(), words.size());
    EXPECT_EQ(chapter_one.count(), 4u);
    EXPECT_EQ(narrowed.count(), 2u);
}

TEST_F(WordFilterTest, ChainOrderDoesNotMatter) {
    WordFilter filter(words);
    EXPECT_EQ(filter.by_chapter(1).by_verse(1, 1).get(),
              filter.by_verse(1, 1).by_chapter(1).get());
    EXPECT_EQ(filter.by_root("أله").by_chapter(1).get(),
              filter.by_chapter(1).by_root("أله").get());
}

TEST_F(WordFilterTest, CustomPredicate) {
    WordFilter filter(words);
    auto first_positions = filter.by_custom([](const Word& w) { return w.position() == 0; });
    EXPECT_EQ(first_positions.count(), 4u);
}

TEST_F(WordFilterTest, CustomPredicateFailureIsWrapped) {
    WordFilter filter(words);

    try {
        filter.by_custom([](const Word&) -> bool { throw std::runtime_error("boom"); });
        FAIL() << "Expected FilterError";
    } catch (const FilterError& e) {
        EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
        EXPECT_THROW(std::rethrow_if_nested(e), std::runtime_error);
    }
}

TEST_F(WordFilterTest, NonStandardPredicateFailureIsWrapped) {
    WordFilter filter(words);

    try {
        filter.by_custom([](const Word&) -> bool { throw 42; });
        FAIL() << "Expected FilterError";
    } catch (const FilterError& e) {
        EXPECT_THROW(std::rethrow_if_nested(e), int);
        EXPECT_EQ(describe_exception(e),
                  "Custom filter failed: non-standard exception: unknown error");
    }
}

TEST_F(WordFilterTest, EmptyPredicateThrows) {
    WordFilter filter(words);
    EXPECT_THROW(filter.by_custom(WordFilter::Predicate{}), FilterError);
}

TEST_F(WordFilterTest, FirstAndLast) {
    WordFilter filter(words);
    ASSERT_TRUE(filter.first().has_value());
    EXPECT_EQ(filter.first()->location(), (WordLocation{1, 1, 0}));
    EXPECT_EQ(filter.last()->location(), (WordLocation{2, 2, 1}));

    WordFilter none = filter.by_chapter(50);
    EXPECT_TRUE(none.empty());
    EXPECT_FALSE(none.first().has_value());
    EXPECT_FALSE(none.last().has_value());
}

TEST_F(WordFilterTest, NullSharedListIsEmpty) {
    WordFilter filter(std::shared_ptr<const std::vector<Word>>{});
    EXPECT_EQ(filter.count(), 0u);
}
