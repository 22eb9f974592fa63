#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace vg {

// ============================================================================
// Verse
// ============================================================================

/**
 * @brief One ordered text unit within a chapter
 *
 * Immutable once constructed. The constructor rejects an out-of-range chapter,
 * a verse number below 1, empty text and a non-positive sequence number.
 */
class Verse {
public:
    Verse(int chapter, int number, std::string text,
          std::optional<int> sequence_number = std::nullopt);

    int chapter() const { return chapter_; }
    int number() const { return number_; }
    const std::string& text() const { return text_; }

    /// Global position of the verse across the whole corpus, when the source provides it
    const std::optional<int>& sequence_number() const { return sequence_number_; }

    std::pair<int, int> location() const { return {chapter_, number_}; }

    /**
     * @brief Whitespace word count
     *
     * Approximation only; the tokenizer's count is authoritative because it
     * also drops pieces that consist solely of punctuation.
     */
    size_t approximate_word_count() const;

    std::string to_string() const;
    nlohmann::json to_json() const;

    bool operator==(const Verse& other) const;
    bool operator!=(const Verse& other) const { return !(*this == other); }

private:
    int chapter_;
    int number_;
    std::string text_;
    std::optional<int> sequence_number_;
};

// ============================================================================
// Chapter
// ============================================================================

/**
 * @brief A top-level grouping of verses
 *
 * Owns its verses. Construction fails on an out-of-range number, an empty name,
 * an empty verse list, or any verse whose chapter differs from this chapter.
 */
class Chapter {
public:
    Chapter(int number, std::string name, std::vector<Verse> verses,
            std::optional<std::string> english_name = std::nullopt,
            std::optional<std::string> revelation_type = std::nullopt);

    int number() const { return number_; }
    const std::string& name() const { return name_; }
    const std::vector<Verse>& verses() const { return verses_; }
    const std::optional<std::string>& english_name() const { return english_name_; }
    const std::optional<std::string>& revelation_type() const { return revelation_type_; }

    size_t verse_count() const { return verses_.size(); }

    /**
     * @brief Look up a verse by its number
     * @return Pointer into this chapter, or nullptr if absent
     */
    const Verse* find_verse(int verse_number) const;

    /// Sum of Verse::approximate_word_count over all verses
    size_t approximate_word_count() const;

    std::string to_string() const;
    nlohmann::json to_json(bool include_verses = true) const;

    bool operator==(const Chapter& other) const;
    bool operator!=(const Chapter& other) const { return !(*this == other); }

private:
    int number_;
    std::string name_;
    std::vector<Verse> verses_;
    std::optional<std::string> english_name_;
    std::optional<std::string> revelation_type_;
};

// ============================================================================
// Word
// ============================================================================

/**
 * @brief Stable identity of a word: (chapter, verse, zero-based position)
 */
struct WordLocation {
    int chapter = 0;
    int verse = 0;
    int position = 0;

    bool operator==(const WordLocation& other) const {
        return chapter == other.chapter && verse == other.verse && position == other.position;
    }
    bool operator!=(const WordLocation& other) const { return !(*this == other); }
    bool operator<(const WordLocation& other) const {
        if (chapter != other.chapter) return chapter < other.chapter;
        if (verse != other.verse) return verse < other.verse;
        return position < other.position;
    }

    std::string to_string() const;
};

/**
 * @brief One tokenized word with its canonical forms
 *
 * Root and lemma are optional: absent means "not known", which is the state
 * every word is in until a morphological analyzer supplies them.
 */
class Word {
public:
    Word(int chapter, int verse, int position,
         std::string text, std::string normalized, std::string transliteration,
         std::optional<std::string> root = std::nullopt,
         std::optional<std::string> lemma = std::nullopt);

    int chapter() const { return location_.chapter; }
    int verse() const { return location_.verse; }
    int position() const { return location_.position; }
    const WordLocation& location() const { return location_; }

    const std::string& text() const { return text_; }
    const std::string& normalized() const { return normalized_; }
    const std::string& transliteration() const { return transliteration_; }
    const std::optional<std::string>& root() const { return root_; }
    const std::optional<std::string>& lemma() const { return lemma_; }

    std::string to_string() const;
    nlohmann::json to_json() const;

    bool operator==(const Word& other) const;
    bool operator!=(const Word& other) const { return !(*this == other); }

private:
    WordLocation location_;
    std::string text_;
    std::string normalized_;
    std::string transliteration_;
    std::optional<std::string> root_;
    std::optional<std::string> lemma_;
};

} // namespace vg

namespace std {

template <>
struct hash<vg::WordLocation> {
    size_t operator()(const vg::WordLocation& location) const noexcept;
};

template <>
struct hash<vg::Verse> {
    size_t operator()(const vg::Verse& verse) const noexcept;
};

template <>
struct hash<vg::Word> {
    size_t operator()(const vg::Word& word) const noexcept;
};

} // namespace std
