#include "graph/word_relation.hpp"
#include <cmath>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace {

using WordGroup = std::pair<std::string, std::vector<const vg::Word*>>;

/**
 * Group words by a feature, keeping groups in order of first appearance.
 * Words whose feature is absent are skipped.
 */
std::vector<WordGroup> group_words(
    const std::vector<vg::Word>& words,
    const std::function<std::optional<std::string>(const vg::Word&)>& feature
) {
    std::vector<WordGroup> groups;
    std::unordered_map<std::string, size_t> group_index;

    for (const auto& word : words) {
        auto key = feature(word);
        if (!key.has_value() || key->empty()) {
            continue;
        }

        auto it = group_index.find(*key);
        if (it == group_index.end()) {
            group_index.emplace(*key, groups.size());
            groups.push_back({*key, {&word}});
        } else {
            groups[it->second].second.push_back(&word);
        }
    }

    return groups;
}

}  // namespace

namespace vg {

// ==========================================
// WordRelation Implementation
// ==========================================

WordRelation::WordRelation(Word first, Word second, std::string kind, double weight,
                           std::optional<std::map<std::string, std::string>> metadata)
    : first_(std::move(first)),
      second_(std::move(second)),
      kind_(std::move(kind)),
      weight_(weight),
      metadata_(std::move(metadata)) {
    if (std::isnan(weight_) || weight_ < 0.0 || weight_ > 1.0) {
        std::ostringstream ss;
        ss << "Weight must be between 0.0 and 1.0, got " << weight_;
        throw std::invalid_argument(ss.str());
    }
    if (kind_.empty()) {
        throw std::invalid_argument("Relation kind cannot be empty");
    }
}

bool WordRelation::involves(const Word& word) const {
    return first_.location() == word.location() || second_.location() == word.location();
}

std::optional<Word> WordRelation::other(const Word& word) const {
    if (first_.location() == word.location()) {
        return second_;
    }
    if (second_.location() == word.location()) {
        return first_;
    }
    return std::nullopt;
}

std::string WordRelation::to_string() const {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss.precision(2);
    ss << first_.text() << " <-[" << kind_ << "]-> " << second_.text()
       << " (weight: " << weight_ << ")";
    return ss.str();
}

nlohmann::json WordRelation::to_json() const {
    nlohmann::json j;
    j["first"] = first_.location().to_string();
    j["second"] = second_.location().to_string();
    j["kind"] = kind_;
    j["weight"] = weight_;
    if (metadata_.has_value()) {
        j["metadata"] = *metadata_;
    }
    return j;
}

bool WordRelation::operator==(const WordRelation& other) const {
    return first_ == other.first_ &&
           second_ == other.second_ &&
           kind_ == other.kind_ &&
           weight_ == other.weight_ &&
           metadata_ == other.metadata_;
}

RelationWeights RelationWeights::from_config(const CorpusConfig& config) {
    RelationWeights weights;
    weights.root = config.root_weight;
    weights.lemma = config.lemma_weight;
    weights.normalized = config.normalized_weight;
    return weights;
}

// ==========================================
// RelationBuilder Implementation
// ==========================================

void RelationBuilder::add_relation(const Word& first, const Word& second, const std::string& kind,
                                   double weight,
                                   std::optional<std::map<std::string, std::string>> metadata) {
    relations_.emplace_back(first, second, kind, weight, std::move(metadata));
}

void RelationBuilder::add_group_pairs(const std::vector<const Word*>& group,
                                      const std::string& kind,
                                      double weight,
                                      const std::string& metadata_key,
                                      const std::string& feature) {
    for (size_t i = 0; i < group.size(); ++i) {
        for (size_t j = i + 1; j < group.size(); ++j) {
            add_relation(*group[i], *group[j], kind, weight,
                         std::map<std::string, std::string>{{metadata_key, feature}});
        }
    }
}

void RelationBuilder::build_root_relations(const std::vector<Word>& words, double weight) {
    auto groups = group_words(words, [](const Word& w) { return w.root(); });

    for (const auto& [root, group] : groups) {
        add_group_pairs(group, kSharedRootRelation, weight, "root", root);
    }
}

void RelationBuilder::build_lemma_relations(const std::vector<Word>& words, double weight) {
    auto groups = group_words(words, [](const Word& w) { return w.lemma(); });

    for (const auto& [lemma, group] : groups) {
        add_group_pairs(group, kSharedLemmaRelation, weight, "lemma", lemma);
    }
}

void RelationBuilder::build_normalized_relations(const std::vector<Word>& words, double weight) {
    auto groups = group_words(words, [](const Word& w) {
        return std::optional<std::string>(w.normalized());
    });

    for (const auto& [normalized, group] : groups) {
        if (group.size() > 1) {
            add_group_pairs(group, kIdenticalNormalizedRelation, weight, "normalized_text", normalized);
        }
    }
}

} // namespace vg
