#include "core/word_filter.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

namespace vg {

WordFilter::WordFilter(std::vector<Word> words)
    : words_(std::make_shared<std::vector<Word>>(std::move(words))) {}

WordFilter::WordFilter(std::shared_ptr<const std::vector<Word>> words)
    : words_(words ? std::move(words) : std::make_shared<std::vector<Word>>()) {}

WordFilter WordFilter::select(const Predicate& predicate) const {
    std::vector<Word> filtered;
    for (const auto& word : *words_) {
        if (predicate(word)) {
            filtered.push_back(word);
        }
    }
    return WordFilter(std::move(filtered));
}

WordFilter WordFilter::by_chapter(int chapter) const {
    if (!is_valid_chapter_number(chapter)) {
        throw FilterError("Invalid chapter number: " + std::to_string(chapter));
    }

    return select([chapter](const Word& w) { return w.chapter() == chapter; });
}

WordFilter WordFilter::by_verse(int chapter, int verse) const {
    if (!is_valid_chapter_number(chapter)) {
        throw FilterError("Invalid chapter number: " + std::to_string(chapter));
    }
    if (verse < 1) {
        throw FilterError("Invalid verse number: " + std::to_string(verse));
    }

    return select([chapter, verse](const Word& w) {
        return w.chapter() == chapter && w.verse() == verse;
    });
}

WordFilter WordFilter::by_text(const std::string& text, bool normalized) const {
    if (normalized) {
        return select([&text](const Word& w) { return w.normalized() == text; });
    }
    return select([&text](const Word& w) { return w.text() == text; });
}

WordFilter WordFilter::by_text_contains(const std::string& substring, bool normalized) const {
    if (normalized) {
        return select([&substring](const Word& w) {
            return w.normalized().find(substring) != std::string::npos;
        });
    }
    return select([&substring](const Word& w) {
        return w.text().find(substring) != std::string::npos;
    });
}

WordFilter WordFilter::by_root(const std::string& root) const {
    return select([&root](const Word& w) { return w.root().has_value() && *w.root() == root; });
}

WordFilter WordFilter::by_lemma(const std::string& lemma) const {
    return select([&lemma](const Word& w) { return w.lemma().has_value() && *w.lemma() == lemma; });
}

WordFilter WordFilter::by_custom(const Predicate& predicate) const {
    if (!predicate) {
        throw FilterError("Custom filter failed: empty predicate");
    }

    try {
        return select(predicate);
    } catch (const std::exception& e) {
        std::throw_with_nested(FilterError(std::string("Custom filter failed: ") + e.what()));
    } catch (...) {
        std::throw_with_nested(FilterError("Custom filter failed: non-standard exception"));
    }
}

std::optional<Word> WordFilter::first() const {
    if (words_->empty()) {
        return std::nullopt;
    }
    return words_->front();
}

std::optional<Word> WordFilter::last() const {
    if (words_->empty()) {
        return std::nullopt;
    }
    return words_->back();
}

} // namespace vg
