#include "core/config.hpp"
#include "core/errors.hpp"
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace vg {

CorpusConfig CorpusConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
        return from_json(j);
    } catch (const json::exception&) {
        std::throw_with_nested(ConfigError("Invalid config file: " + path));
    }
}

CorpusConfig CorpusConfig::from_json(const json& j) {
    CorpusConfig config;

    if (j.contains("data_path")) config.data_path = j["data_path"].get<std::string>();
    if (j.contains("file_prefix")) config.file_prefix = j["file_prefix"].get<std::string>();
    if (j.contains("first_chapter")) config.first_chapter = j["first_chapter"].get<int>();
    if (j.contains("last_chapter")) config.last_chapter = j["last_chapter"].get<int>();
    if (j.contains("delimiter")) config.delimiter = j["delimiter"].get<std::string>();

    if (j.contains("normalization")) {
        config.normalization = NormalizationOptions::from_json(j["normalization"]);
    }

    if (j.contains("root_weight")) config.root_weight = j["root_weight"].get<double>();
    if (j.contains("lemma_weight")) config.lemma_weight = j["lemma_weight"].get<double>();
    if (j.contains("normalized_weight")) config.normalized_weight = j["normalized_weight"].get<double>();

    if (j.contains("verbose")) config.verbose = j["verbose"].get<bool>();

    return config;
}

json CorpusConfig::to_json() const {
    json j;
    j["data_path"] = data_path;
    j["file_prefix"] = file_prefix;
    j["first_chapter"] = first_chapter;
    j["last_chapter"] = last_chapter;
    j["delimiter"] = delimiter;
    j["normalization"] = normalization.to_json();
    j["root_weight"] = root_weight;
    j["lemma_weight"] = lemma_weight;
    j["normalized_weight"] = normalized_weight;
    j["verbose"] = verbose;
    return j;
}

void CorpusConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file for writing: " + path);
    }
    file << to_json().dump(2);
}

CorpusConfig CorpusConfig::from_environment() {
    CorpusConfig config;

    const char* data_path = std::getenv("VG_DATA_PATH");
    if (data_path) config.data_path = data_path;

    const char* prefix = std::getenv("VG_FILE_PREFIX");
    if (prefix) config.file_prefix = prefix;

    const char* verbose = std::getenv("VG_VERBOSE");
    if (verbose) {
        std::string value = verbose;
        config.verbose = (value == "1" || value == "true" || value == "yes");
    }

    return config;
}

bool CorpusConfig::validate(std::string& error_message) const {
    if (data_path.empty()) {
        error_message = "Data path is required";
        return false;
    }

    if (!is_valid_chapter_number(first_chapter) || !is_valid_chapter_number(last_chapter)) {
        error_message = "Chapter range must lie within 1.." + std::to_string(kTotalChapters);
        return false;
    }

    if (first_chapter > last_chapter) {
        error_message = "First chapter must not exceed last chapter";
        return false;
    }

    if (delimiter.empty()) {
        error_message = "Delimiter must not be empty";
        return false;
    }

    for (double weight : {root_weight, lemma_weight, normalized_weight}) {
        if (weight < 0.0 || weight > 1.0) {
            error_message = "Relation weights must be between 0.0 and 1.0";
            return false;
        }
    }

    return true;
}

CorpusConfig load_config_with_fallback(const std::string& config_path) {
    if (!config_path.empty()) {
        return CorpusConfig::from_json_file(config_path);
    }
    return CorpusConfig::from_environment();
}

} // namespace vg
