#include "core/text_model.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include <numeric>
#include <sstream>

namespace {

void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

size_t hash_optional(const std::optional<std::string>& value) {
    return value.has_value() ? std::hash<std::string>{}(*value) : 0;
}

void require_chapter(int chapter, const std::string& what) {
    if (!vg::is_valid_chapter_number(chapter)) {
        throw vg::DataValidationError("Invalid " + what + " chapter number: " + std::to_string(chapter));
    }
}

}  // namespace

namespace vg {

// ============================================================================
// Verse
// ============================================================================

Verse::Verse(int chapter, int number, std::string text, std::optional<int> sequence_number)
    : chapter_(chapter),
      number_(number),
      text_(std::move(text)),
      sequence_number_(sequence_number) {
    require_chapter(chapter_, "verse");
    if (number_ < 1) {
        throw DataValidationError("Invalid verse number: " + std::to_string(number_));
    }
    if (text_.empty()) {
        throw DataValidationError("Verse text cannot be empty");
    }
    if (sequence_number_.has_value() && *sequence_number_ < 1) {
        throw DataValidationError("Invalid verse sequence number: " + std::to_string(*sequence_number_));
    }
}

size_t Verse::approximate_word_count() const {
    std::istringstream stream(text_);
    size_t count = 0;
    std::string piece;
    while (stream >> piece) {
        ++count;
    }
    return count;
}

std::string Verse::to_string() const {
    std::ostringstream ss;
    ss << "Verse " << chapter_ << ":" << number_ << " - ";
    ss << (text_.size() > 50 ? text_.substr(0, 50) + "..." : text_);
    return ss.str();
}

nlohmann::json Verse::to_json() const {
    nlohmann::json j;
    j["chapter"] = chapter_;
    j["verse"] = number_;
    j["text"] = text_;
    if (sequence_number_.has_value()) {
        j["sequence_number"] = *sequence_number_;
    }
    return j;
}

bool Verse::operator==(const Verse& other) const {
    return chapter_ == other.chapter_ &&
           number_ == other.number_ &&
           text_ == other.text_ &&
           sequence_number_ == other.sequence_number_;
}

// ============================================================================
// Chapter
// ============================================================================

Chapter::Chapter(int number, std::string name, std::vector<Verse> verses,
                 std::optional<std::string> english_name,
                 std::optional<std::string> revelation_type)
    : number_(number),
      name_(std::move(name)),
      verses_(std::move(verses)),
      english_name_(std::move(english_name)),
      revelation_type_(std::move(revelation_type)) {
    require_chapter(number_, "chapter");
    if (name_.empty()) {
        throw DataValidationError("Chapter name cannot be empty");
    }
    if (verses_.empty()) {
        throw DataValidationError("Chapter must contain at least one verse");
    }

    for (const auto& verse : verses_) {
        if (verse.chapter() != number_) {
            throw DataValidationError(
                "Verse chapter number " + std::to_string(verse.chapter()) +
                " does not match chapter number " + std::to_string(number_)
            );
        }
    }
}

const Verse* Chapter::find_verse(int verse_number) const {
    for (const auto& verse : verses_) {
        if (verse.number() == verse_number) {
            return &verse;
        }
    }
    return nullptr;
}

size_t Chapter::approximate_word_count() const {
    return std::accumulate(verses_.begin(), verses_.end(), size_t{0},
                           [](size_t total, const Verse& verse) {
                               return total + verse.approximate_word_count();
                           });
}

std::string Chapter::to_string() const {
    return "Chapter " + std::to_string(number_) + ": " + name_ +
           " (" + std::to_string(verses_.size()) + " verses)";
}

nlohmann::json Chapter::to_json(bool include_verses) const {
    nlohmann::json j;
    j["number"] = number_;
    j["name"] = name_;
    j["english_name"] = english_name_.has_value() ? nlohmann::json(*english_name_) : nlohmann::json();
    j["revelation_type"] = revelation_type_.has_value() ? nlohmann::json(*revelation_type_) : nlohmann::json();
    j["verse_count"] = verses_.size();

    if (include_verses) {
        nlohmann::json verses_json = nlohmann::json::array();
        for (const auto& verse : verses_) {
            verses_json.push_back(verse.to_json());
        }
        j["verses"] = verses_json;
    }

    return j;
}

bool Chapter::operator==(const Chapter& other) const {
    return number_ == other.number_ &&
           name_ == other.name_ &&
           verses_ == other.verses_ &&
           english_name_ == other.english_name_ &&
           revelation_type_ == other.revelation_type_;
}

// ============================================================================
// Word
// ============================================================================

std::string WordLocation::to_string() const {
    return std::to_string(chapter) + ":" + std::to_string(verse) + ":" + std::to_string(position);
}

Word::Word(int chapter, int verse, int position,
           std::string text, std::string normalized, std::string transliteration,
           std::optional<std::string> root, std::optional<std::string> lemma)
    : location_{chapter, verse, position},
      text_(std::move(text)),
      normalized_(std::move(normalized)),
      transliteration_(std::move(transliteration)),
      root_(std::move(root)),
      lemma_(std::move(lemma)) {
    require_chapter(chapter, "word");
    if (verse < 1) {
        throw DataValidationError("Invalid word verse number: " + std::to_string(verse));
    }
    if (position < 0) {
        throw DataValidationError("Invalid word position: " + std::to_string(position));
    }
    if (text_.empty()) {
        throw DataValidationError("Word text cannot be empty");
    }
    if (normalized_.empty()) {
        throw DataValidationError("Normalized text cannot be empty (word " + location_.to_string() + ")");
    }
    if (transliteration_.empty()) {
        throw DataValidationError("Transliteration cannot be empty (word " + location_.to_string() + ")");
    }
}

std::string Word::to_string() const {
    return text_ + " (" + location_.to_string() + ")";
}

nlohmann::json Word::to_json() const {
    nlohmann::json j;
    j["chapter"] = location_.chapter;
    j["verse"] = location_.verse;
    j["position"] = location_.position;
    j["text"] = text_;
    j["normalized"] = normalized_;
    j["transliteration"] = transliteration_;
    if (root_.has_value()) {
        j["root"] = *root_;
    }
    if (lemma_.has_value()) {
        j["lemma"] = *lemma_;
    }
    return j;
}

bool Word::operator==(const Word& other) const {
    return location_ == other.location_ &&
           text_ == other.text_ &&
           normalized_ == other.normalized_ &&
           transliteration_ == other.transliteration_ &&
           root_ == other.root_ &&
           lemma_ == other.lemma_;
}

} // namespace vg

namespace std {

size_t hash<vg::WordLocation>::operator()(const vg::WordLocation& location) const noexcept {
    size_t seed = std::hash<int>{}(location.chapter);
    hash_combine(seed, std::hash<int>{}(location.verse));
    hash_combine(seed, std::hash<int>{}(location.position));
    return seed;
}

size_t hash<vg::Verse>::operator()(const vg::Verse& verse) const noexcept {
    size_t seed = std::hash<int>{}(verse.chapter());
    hash_combine(seed, std::hash<int>{}(verse.number()));
    hash_combine(seed, std::hash<std::string>{}(verse.text()));
    hash_combine(seed, verse.sequence_number().has_value()
                           ? std::hash<int>{}(*verse.sequence_number())
                           : 0);
    return seed;
}

size_t hash<vg::Word>::operator()(const vg::Word& word) const noexcept {
    size_t seed = std::hash<vg::WordLocation>{}(word.location());
    hash_combine(seed, std::hash<std::string>{}(word.text()));
    hash_combine(seed, std::hash<std::string>{}(word.normalized()));
    hash_combine(seed, std::hash<std::string>{}(word.transliteration()));
    hash_combine(seed, hash_optional(word.root()));
    hash_combine(seed, hash_optional(word.lemma()));
    return seed;
}

} // namespace std
