#pragma once

#include "text/normalizer.hpp"
#include <string>

namespace vg {

// ============================================================================
// Fixed Corpus Constants
// ============================================================================

constexpr int kTotalChapters = 114;

// Source document schema (one JSON document per chapter)
inline const std::string kChapterNumberKey = "number";
inline const std::string kChapterNameKey = "name";
inline const std::string kChapterEnglishNameKey = "englishName";
inline const std::string kChapterCategoryKey = "revelationType";
inline const std::string kVersesKey = "ayahs";
inline const std::string kVerseNumberKey = "numberInSurah";
inline const std::string kVerseTextKey = "text";
inline const std::string kVerseSequenceKey = "number";

inline const std::string kDefaultFilePrefix = "surah_";
inline const std::string kExportFormatVersion = "1.0.0";

// Default relation weights
constexpr double kSharedRootWeight = 1.0;
constexpr double kSharedLemmaWeight = 0.5;
constexpr double kNormalizedFormWeight = 0.8;

inline bool is_valid_chapter_number(int chapter) {
    return chapter >= 1 && chapter <= kTotalChapters;
}

// ============================================================================
// Corpus Configuration
// ============================================================================

/**
 * @brief Settings for loading and building a corpus
 */
struct CorpusConfig {
    std::string data_path;                          ///< Directory holding one JSON file per chapter
    std::string file_prefix = kDefaultFilePrefix;   ///< File name is <prefix><chapter>.json
    int first_chapter = 1;                          ///< First chapter loaded by build()
    int last_chapter = kTotalChapters;              ///< Last chapter loaded by build()
    std::string delimiter = " ";                    ///< Word delimiter for tokenization
    NormalizationOptions normalization;             ///< Options used for Word::normalized

    double root_weight = kSharedRootWeight;
    double lemma_weight = kSharedLemmaWeight;
    double normalized_weight = kNormalizedFormWeight;

    bool verbose = false;                           ///< Progress output on stdout

    /**
     * @brief Load configuration from JSON file
     * @throws ConfigError if the file cannot be read or parsed
     */
    static CorpusConfig from_json_file(const std::string& path);

    static CorpusConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables (VG_DATA_PATH, VG_FILE_PREFIX, VG_VERBOSE)
     */
    static CorpusConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

/**
 * @brief Load configuration from file with fallback to environment
 */
CorpusConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace vg
