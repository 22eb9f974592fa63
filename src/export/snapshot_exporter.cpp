#include "export/snapshot_exporter.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace vg {

SnapshotExporter::SnapshotExporter(const Corpus& corpus)
    : corpus_(corpus) {
    if (!corpus_.is_built()) {
        throw CorpusStateError("Corpus must be built before export");
    }
}

std::string SnapshotExporter::current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

void SnapshotExporter::write_document(const nlohmann::json& document, const std::string& output_path) {
    fs::path path(output_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ExportError("Failed to create directory " + path.parent_path().string() +
                              ": " + ec.message());
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw ExportError("Failed to open file for writing: " + output_path);
    }

    file << document.dump(2);
    if (!file) {
        throw ExportError("Failed to write file: " + output_path);
    }
}

nlohmann::json SnapshotExporter::metadata() const {
    return {
        {"format_version", kExportFormatVersion},
        {"export_timestamp", current_timestamp()},
        {"total_chapters", corpus_.total_chapters()},
        {"total_verses", corpus_.total_verses()},
        {"total_words", corpus_.total_words()}
    };
}

nlohmann::json SnapshotExporter::word_list(const std::vector<Word>& words, const WordFields& fields) {
    nlohmann::json list = nlohmann::json::array();

    for (const auto& word : words) {
        nlohmann::json entry = nlohmann::json::object();

        if (fields.location) {
            entry["chapter"] = word.chapter();
            entry["verse"] = word.verse();
            entry["position"] = word.position();
        }
        if (fields.text) {
            entry["text"] = word.text();
        }
        if (fields.normalized) {
            entry["normalized"] = word.normalized();
        }
        if (fields.transliteration) {
            entry["transliteration"] = word.transliteration();
        }
        if (word.root().has_value()) {
            entry["root"] = *word.root();
        }
        if (word.lemma().has_value()) {
            entry["lemma"] = *word.lemma();
        }

        list.push_back(std::move(entry));
    }

    return list;
}

void SnapshotExporter::export_full_snapshot(const std::string& output_path, bool include_all_words) const {
    try {
        nlohmann::json snapshot;
        snapshot["metadata"] = metadata();

        nlohmann::json counts = nlohmann::json::object();
        for (const auto& [chapter, count] : corpus_.word_count_by_chapter()) {
            counts[std::to_string(chapter)] = count;
        }
        snapshot["word_counts_by_chapter"] = counts;

        if (include_all_words) {
            snapshot["words"] = word_list(corpus_.words());
        }

        write_document(snapshot, output_path);
    } catch (const std::exception&) {
        std::throw_with_nested(ExportError("Failed to export snapshot to " + output_path));
    }
}

void SnapshotExporter::export_chapter_summary(int chapter_number, const std::string& output_path) const {
    try {
        const Chapter* chapter = corpus_.find_chapter(chapter_number);
        if (chapter == nullptr) {
            throw ExportError("Chapter " + std::to_string(chapter_number) + " is not in the corpus");
        }

        auto words = corpus_.filter_words().by_chapter(chapter_number).get();

        nlohmann::json summary;
        summary["chapter_number"] = chapter->number();
        summary["chapter_name"] = chapter->name();
        summary["english_name"] = chapter->english_name().has_value()
            ? nlohmann::json(*chapter->english_name()) : nlohmann::json(nullptr);
        summary["revelation_type"] = chapter->revelation_type().has_value()
            ? nlohmann::json(*chapter->revelation_type()) : nlohmann::json(nullptr);
        summary["verse_count"] = chapter->verse_count();
        summary["word_count"] = words.size();
        summary["words"] = word_list(words);

        write_document(summary, output_path);
    } catch (const std::exception&) {
        std::throw_with_nested(ExportError("Failed to export chapter " +
                                           std::to_string(chapter_number) + " summary"));
    }
}

void SnapshotExporter::export_filtered_words(const std::vector<Word>& words,
                                             const std::string& output_path,
                                             const std::string& description) const {
    try {
        nlohmann::json document;
        document["metadata"] = {
            {"format_version", kExportFormatVersion},
            {"export_timestamp", current_timestamp()},
            {"word_count", words.size()},
            {"description", description}
        };
        document["words"] = word_list(words);

        write_document(document, output_path);
    } catch (const std::exception&) {
        std::throw_with_nested(ExportError("Failed to export filtered words to " + output_path));
    }
}

} // namespace vg
