#pragma once

#include "core/config.hpp"
#include "core/text_model.hpp"
#include "core/word_filter.hpp"
#include "data/chapter_loader.hpp"
#include "text/tokenizer.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vg {

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

/**
 * @brief The authoritative word-level model of a chapter dataset
 *
 * Two-phase object: construct, then build(). build() runs
 * Loader -> Tokenizer -> Normalizer -> Transliterator over the configured chapter
 * range and keeps the resulting word list for the lifetime of the corpus.
 * Every query made before a successful build() throws CorpusStateError.
 */
class Corpus {
public:
    /**
     * @throws ConfigError if the configuration does not validate
     * @throws DataLoadError if the data path is missing or not a directory
     */
    explicit Corpus(const CorpusConfig& config);
    explicit Corpus(const std::string& data_path);

    /**
     * @brief Load every configured chapter and derive its words
     *
     * All or nothing: on failure the corpus is left unbuilt and the failure is
     * rethrown as VerseGraphError with the original cause nested.
     */
    void build();

    bool is_built() const { return words_ != nullptr; }

    const std::vector<Chapter>& chapters() const;
    const std::vector<Word>& words() const;

    /**
     * @return Pointer to the chapter, or nullptr if it is not part of the corpus
     */
    const Chapter* find_chapter(int chapter_number) const;
    const Verse* find_verse(int chapter_number, int verse_number) const;

    /**
     * @brief A fresh filter seeded with every word of the corpus
     */
    WordFilter filter_words() const;

    size_t total_chapters() const;
    size_t total_verses() const;
    size_t total_words() const;

    /**
     * @brief Word count per chapter, computed by filtering on each chapter
     */
    std::map<int, size_t> word_count_by_chapter() const;

    const CorpusConfig& config() const { return config_; }

    void set_progress_callback(ProgressCallback callback);

    std::string to_string() const;

    /**
     * @brief Tokenize a verse and derive one Word per token
     *
     * Root and lemma stay absent; no morphological analysis happens here.
     */
    static std::vector<Word> words_from_verse(
        const Verse& verse,
        const std::string& delimiter = kDefaultDelimiter,
        const NormalizationOptions& options = {}
    );

private:
    CorpusConfig config_;
    ChapterLoader loader_;
    ProgressCallback progress_callback_;

    std::optional<std::vector<Chapter>> chapters_;
    std::shared_ptr<const std::vector<Word>> words_;

    void require_built() const;

    void report_progress(
        const std::string& stage,
        int current,
        int total,
        const std::string& message = ""
    );
};

} // namespace vg
