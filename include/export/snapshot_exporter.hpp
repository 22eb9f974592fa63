#pragma once

#include "core/corpus.hpp"
#include "core/text_model.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vg {

/**
 * @brief Which word fields to serialize
 *
 * Root and lemma are always written when present.
 */
struct WordFields {
    bool location = true;
    bool text = true;
    bool normalized = true;
    bool transliteration = true;
};

/**
 * @brief Writes JSON snapshots of a built corpus
 *
 * Every export creates missing parent directories and writes pretty-printed
 * UTF-8 JSON. Failures throw ExportError with the cause nested.
 */
class SnapshotExporter {
public:
    /**
     * @throws CorpusStateError if the corpus has not been built
     */
    explicit SnapshotExporter(const Corpus& corpus);

    /**
     * @brief Format version, UTC export timestamp and aggregate counts
     */
    nlohmann::json metadata() const;

    static nlohmann::json word_list(const std::vector<Word>& words, const WordFields& fields = {});

    /**
     * @brief Metadata and per-chapter word counts, optionally with every word
     */
    void export_full_snapshot(const std::string& output_path, bool include_all_words = false) const;

    /**
     * @brief One chapter's details and its words
     */
    void export_chapter_summary(int chapter_number, const std::string& output_path) const;

    /**
     * @brief An arbitrary word list with a free-text description
     */
    void export_filtered_words(const std::vector<Word>& words,
                               const std::string& output_path,
                               const std::string& description = "") const;

private:
    const Corpus& corpus_;

    static std::string current_timestamp();
    static void write_document(const nlohmann::json& document, const std::string& output_path);
};

} // namespace vg
