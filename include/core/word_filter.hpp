#pragma once

#include "core/text_model.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vg {

/**
 * @brief Immutable, chainable query over a word sequence
 *
 * Every by_* call returns a new filter over the matching subset and leaves the
 * receiver untouched. Source order is preserved.
 *
 * Example:
 *   auto words = corpus.filter_words().by_chapter(2).by_text_contains("الله", true).get();
 */
class WordFilter {
public:
    using Predicate = std::function<bool(const Word&)>;

    WordFilter() = default;
    explicit WordFilter(std::vector<Word> words);
    explicit WordFilter(std::shared_ptr<const std::vector<Word>> words);

    /**
     * @throws FilterError if chapter is outside 1..kTotalChapters
     */
    WordFilter by_chapter(int chapter) const;

    /**
     * @throws FilterError if chapter is out of range or verse < 1
     */
    WordFilter by_verse(int chapter, int verse) const;

    /**
     * @brief Exact match against the raw text, or the normalized text when requested
     */
    WordFilter by_text(const std::string& text, bool normalized = false) const;

    WordFilter by_text_contains(const std::string& substring, bool normalized = false) const;

    /// Words whose root is present and equal to root
    WordFilter by_root(const std::string& root) const;

    /// Words whose lemma is present and equal to lemma
    WordFilter by_lemma(const std::string& lemma) const;

    /**
     * @throws FilterError wrapping any exception thrown by the predicate
     */
    WordFilter by_custom(const Predicate& predicate) const;

    const std::vector<Word>& get() const { return *words_; }
    size_t count() const { return words_->size(); }
    bool empty() const { return words_->empty(); }

    std::optional<Word> first() const;
    std::optional<Word> last() const;

private:
    WordFilter select(const Predicate& predicate) const;

    std::shared_ptr<const std::vector<Word>> words_ = std::make_shared<std::vector<Word>>();
};

} // namespace vg
