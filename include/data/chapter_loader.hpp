#pragma once

#include "core/config.hpp"
#include "core/text_model.hpp"
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace vg {

/**
 * @brief Result of auditing every chapter document of a dataset
 */
struct DatasetReport {
    int valid_chapters = 0;                                 ///< Present and loadable
    std::vector<int> missing_chapters;                      ///< No document on disk
    std::vector<std::pair<int, std::string>> invalid_chapters;  ///< Present but unloadable, with reason
    size_t total_verses = 0;                                ///< Verses across valid chapters

    bool is_complete() const {
        return missing_chapters.empty() && invalid_chapters.empty();
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Reads and validates one JSON document per chapter
 *
 * Documents live in a single directory and are named <prefix><chapter>.json.
 * See config.hpp for the key names of the document schema.
 */
class ChapterLoader {
public:
    /**
     * @throws DataLoadError if data_path is missing or not a directory
     */
    explicit ChapterLoader(const std::string& data_path,
                           const std::string& file_prefix = kDefaultFilePrefix);

    /**
     * @brief Load and validate a single chapter
     * @throws DataLoadError for an invalid index, missing file or unparseable JSON
     * @throws DataValidationError for a structurally wrong document
     */
    Chapter load_chapter(int chapter_number) const;

    /**
     * @brief Load an inclusive range of chapters in ascending order
     *
     * All or nothing: the first failing chapter aborts the whole call.
     */
    std::vector<Chapter> load_all(int start = 1, int end = kTotalChapters) const;

    /**
     * @brief Classify every chapter as valid, invalid or missing without aborting
     */
    DatasetReport verify_dataset() const;

    /**
     * @brief Validate a parsed document against the schema
     * @throws DataValidationError describing the first violation
     */
    static void validate_document(const nlohmann::json& document, int chapter_number);

    /**
     * @brief Build a chapter from a document that passed validate_document()
     */
    static Chapter chapter_from_json(const nlohmann::json& document, int chapter_number);

    std::filesystem::path chapter_path(int chapter_number) const;

    const std::filesystem::path& data_path() const { return data_path_; }

private:
    std::filesystem::path data_path_;
    std::string file_prefix_;
};

} // namespace vg
