#include "core/corpus.hpp"
#include "core/errors.hpp"
#include "text/normalizer.hpp"
#include "text/tokenizer.hpp"
#include "text/transliterator.hpp"
#include <iostream>
#include <numeric>

namespace {

vg::CorpusConfig validated(const vg::CorpusConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw vg::ConfigError("Invalid configuration: " + error);
    }
    return config;
}

vg::CorpusConfig config_for_path(const std::string& data_path) {
    vg::CorpusConfig config;
    config.data_path = data_path;
    return config;
}

}  // namespace

namespace vg {

Corpus::Corpus(const CorpusConfig& config)
    : config_(validated(config)),
      loader_(config_.data_path, config_.file_prefix) {}

Corpus::Corpus(const std::string& data_path)
    : Corpus(config_for_path(data_path)) {}

void Corpus::build() {
    chapters_.reset();
    words_.reset();

    try {
        report_progress("Loading", 0, 1, config_.data_path);
        auto chapters = loader_.load_all(config_.first_chapter, config_.last_chapter);

        if (config_.verbose) {
            std::cout << "Loaded " << chapters.size() << " chapters from "
                      << config_.data_path << "\n";
        }

        auto words = std::make_shared<std::vector<Word>>();
        const int total = static_cast<int>(chapters.size());

        for (int i = 0; i < total; ++i) {
            const Chapter& chapter = chapters[i];
            report_progress("Tokenizing", i + 1, total, chapter.name());

            for (const auto& verse : chapter.verses()) {
                auto verse_words = words_from_verse(verse, config_.delimiter, config_.normalization);
                words->insert(words->end(),
                              std::make_move_iterator(verse_words.begin()),
                              std::make_move_iterator(verse_words.end()));
            }
        }

        if (config_.verbose) {
            std::cout << "Built corpus with " << words->size() << " words\n";
        }

        // Commit only once every stage has succeeded
        chapters_ = std::move(chapters);
        words_ = std::move(words);
    } catch (const std::exception&) {
        chapters_.reset();
        words_.reset();
        std::throw_with_nested(VerseGraphError("Failed to build corpus"));
    }
}

std::vector<Word> Corpus::words_from_verse(
    const Verse& verse,
    const std::string& delimiter,
    const NormalizationOptions& options
) {
    std::vector<Word> words;

    for (const auto& [token, position] : Tokenizer::tokenize_with_positions(verse.text(), delimiter)) {
        words.emplace_back(
            verse.chapter(),
            verse.number(),
            static_cast<int>(position),
            token,
            Normalizer::normalize(token, options),
            Transliterator::to_transliteration(token)
        );
    }

    return words;
}

void Corpus::require_built() const {
    if (!is_built()) {
        throw CorpusStateError("Corpus not built. Call build() first.");
    }
}

const std::vector<Chapter>& Corpus::chapters() const {
    require_built();
    return *chapters_;
}

const std::vector<Word>& Corpus::words() const {
    require_built();
    return *words_;
}

const Chapter* Corpus::find_chapter(int chapter_number) const {
    for (const auto& chapter : chapters()) {
        if (chapter.number() == chapter_number) {
            return &chapter;
        }
    }
    return nullptr;
}

const Verse* Corpus::find_verse(int chapter_number, int verse_number) const {
    const Chapter* chapter = find_chapter(chapter_number);
    return chapter ? chapter->find_verse(verse_number) : nullptr;
}

WordFilter Corpus::filter_words() const {
    require_built();
    return WordFilter(words_);
}

size_t Corpus::total_chapters() const {
    return chapters().size();
}

size_t Corpus::total_verses() const {
    const auto& all = chapters();
    return std::accumulate(all.begin(), all.end(), size_t{0},
                           [](size_t total, const Chapter& c) { return total + c.verse_count(); });
}

size_t Corpus::total_words() const {
    return words().size();
}

std::map<int, size_t> Corpus::word_count_by_chapter() const {
    std::map<int, size_t> counts;
    WordFilter all = filter_words();

    for (const auto& chapter : chapters()) {
        counts[chapter.number()] = all.by_chapter(chapter.number()).count();
    }

    return counts;
}

void Corpus::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

std::string Corpus::to_string() const {
    if (!is_built()) {
        return "Corpus(unbuilt)";
    }
    return "Corpus(chapters=" + std::to_string(total_chapters()) +
           ", verses=" + std::to_string(total_verses()) +
           ", words=" + std::to_string(total_words()) + ")";
}

void Corpus::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }
}

} // namespace vg
