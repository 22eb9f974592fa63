#include "data/chapter_loader.hpp"
#include "core/errors.hpp"
#include <cstdint>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<std::string> optional_string(const json& document, const std::string& key) {
    if (document.contains(key) && document[key].is_string()) {
        return document[key].get<std::string>();
    }
    return std::nullopt;
}

/// Read a JSON integer as int, rejecting values that would narrow
int checked_int(const json& value, const std::string& label) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw vg::DataValidationError(label + " out of range: " + std::to_string(raw));
        }
        return static_cast<int>(raw);
    }

    const auto raw = value.get<std::int64_t>();
    if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
        throw vg::DataValidationError(label + " out of range: " + std::to_string(raw));
    }
    return static_cast<int>(raw);
}

}  // namespace

namespace vg {

// ============================================================================
// DatasetReport
// ============================================================================

json DatasetReport::to_json() const {
    json j;
    j["valid_chapters"] = valid_chapters;
    j["missing_chapters"] = missing_chapters;

    json invalid = json::array();
    for (const auto& [chapter, reason] : invalid_chapters) {
        invalid.push_back({{"chapter", chapter}, {"reason", reason}});
    }
    j["invalid_chapters"] = invalid;
    j["total_verses"] = total_verses;
    j["complete"] = is_complete();

    return j;
}

// ============================================================================
// ChapterLoader
// ============================================================================

ChapterLoader::ChapterLoader(const std::string& data_path, const std::string& file_prefix)
    : data_path_(data_path), file_prefix_(file_prefix) {
    std::error_code ec;
    if (!fs::exists(data_path_, ec)) {
        throw DataLoadError("Data path does not exist: " + data_path);
    }
    if (!fs::is_directory(data_path_, ec)) {
        throw DataLoadError("Data path is not a directory: " + data_path);
    }
}

fs::path ChapterLoader::chapter_path(int chapter_number) const {
    return data_path_ / (file_prefix_ + std::to_string(chapter_number) + ".json");
}

void ChapterLoader::validate_document(const json& document, int chapter_number) {
    if (!document.is_object()) {
        throw DataValidationError("Chapter document must be a JSON object");
    }

    for (const auto& key : {kChapterNumberKey, kChapterNameKey, kVersesKey}) {
        if (!document.contains(key)) {
            throw DataValidationError("Missing key: " + key);
        }
    }

    const auto& number = document[kChapterNumberKey];
    if (!number.is_number_integer()) {
        throw DataValidationError("Key '" + kChapterNumberKey + "' must be an integer");
    }
    const int declared = checked_int(number, "Key '" + kChapterNumberKey + "'");
    if (declared != chapter_number) {
        throw DataValidationError(
            "Chapter number mismatch: expected " + std::to_string(chapter_number) +
            ", got " + std::to_string(declared)
        );
    }

    if (!document[kChapterNameKey].is_string()) {
        throw DataValidationError("Key '" + kChapterNameKey + "' must be a string");
    }

    const auto& verses = document[kVersesKey];
    if (!verses.is_array()) {
        throw DataValidationError("Key '" + kVersesKey + "' must be a list");
    }
    if (verses.empty()) {
        throw DataValidationError("Chapter must contain at least one verse");
    }

    for (size_t i = 0; i < verses.size(); ++i) {
        const auto& entry = verses[i];
        const std::string label = "Verse entry " + std::to_string(i);

        if (!entry.is_object()) {
            throw DataValidationError(label + " is not an object");
        }
        if (!entry.contains(kVerseNumberKey)) {
            throw DataValidationError(label + " missing key: " + kVerseNumberKey);
        }
        if (!entry.contains(kVerseTextKey)) {
            throw DataValidationError(label + " missing key: " + kVerseTextKey);
        }
        if (!entry[kVerseNumberKey].is_number_integer()) {
            throw DataValidationError(label + " key '" + kVerseNumberKey + "' must be an integer");
        }
        if (!entry[kVerseTextKey].is_string()) {
            throw DataValidationError(label + " key '" + kVerseTextKey + "' must be a string");
        }
        checked_int(entry[kVerseNumberKey], label + " key '" + kVerseNumberKey + "'");
        if (entry.contains(kVerseSequenceKey) && entry[kVerseSequenceKey].is_number_integer()) {
            checked_int(entry[kVerseSequenceKey], label + " key '" + kVerseSequenceKey + "'");
        }
    }
}

Chapter ChapterLoader::chapter_from_json(const json& document, int chapter_number) {
    std::vector<Verse> verses;
    verses.reserve(document[kVersesKey].size());

    for (const auto& entry : document[kVersesKey]) {
        std::optional<int> sequence_number;
        if (entry.contains(kVerseSequenceKey) && entry[kVerseSequenceKey].is_number_integer()) {
            sequence_number = checked_int(entry[kVerseSequenceKey], kVerseSequenceKey);
        }

        verses.emplace_back(
            chapter_number,
            checked_int(entry[kVerseNumberKey], kVerseNumberKey),
            entry[kVerseTextKey].get<std::string>(),
            sequence_number
        );
    }

    return Chapter(
        chapter_number,
        document[kChapterNameKey].get<std::string>(),
        std::move(verses),
        optional_string(document, kChapterEnglishNameKey),
        optional_string(document, kChapterCategoryKey)
    );
}

Chapter ChapterLoader::load_chapter(int chapter_number) const {
    if (!is_valid_chapter_number(chapter_number)) {
        throw DataLoadError("Invalid chapter number: " + std::to_string(chapter_number));
    }

    fs::path file_path = chapter_path(chapter_number);
    std::error_code ec;
    if (!fs::exists(file_path, ec)) {
        throw DataLoadError("Chapter file not found: " + file_path.string());
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataLoadError("Failed to open file for reading: " + file_path.string());
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error&) {
        std::throw_with_nested(DataLoadError("Invalid JSON in " + file_path.string()));
    }

    try {
        validate_document(document, chapter_number);
        return chapter_from_json(document, chapter_number);
    } catch (const DataValidationError&) {
        std::throw_with_nested(DataValidationError("Invalid chapter document " + file_path.string()));
    }
}

std::vector<Chapter> ChapterLoader::load_all(int start, int end) const {
    if (!is_valid_chapter_number(start)) {
        throw DataLoadError("Invalid start chapter number: " + std::to_string(start));
    }
    if (!is_valid_chapter_number(end)) {
        throw DataLoadError("Invalid end chapter number: " + std::to_string(end));
    }
    if (start > end) {
        throw DataLoadError("Start (" + std::to_string(start) + ") must be <= end (" +
                            std::to_string(end) + ")");
    }

    std::vector<Chapter> chapters;
    chapters.reserve(static_cast<size_t>(end - start + 1));

    for (int chapter_number = start; chapter_number <= end; ++chapter_number) {
        chapters.push_back(load_chapter(chapter_number));
    }

    return chapters;
}

DatasetReport ChapterLoader::verify_dataset() const {
    DatasetReport report;

    for (int chapter_number = 1; chapter_number <= kTotalChapters; ++chapter_number) {
        std::error_code ec;
        if (!fs::exists(chapter_path(chapter_number), ec)) {
            report.missing_chapters.push_back(chapter_number);
            continue;
        }

        try {
            Chapter chapter = load_chapter(chapter_number);
            report.valid_chapters++;
            report.total_verses += chapter.verse_count();
        } catch (const DataLoadError& e) {
            report.invalid_chapters.emplace_back(chapter_number, describe_exception(e));
        } catch (const DataValidationError& e) {
            report.invalid_chapters.emplace_back(chapter_number, describe_exception(e));
        }
    }

    return report;
}

} // namespace vg
