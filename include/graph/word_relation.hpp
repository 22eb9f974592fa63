#pragma once

#include "core/config.hpp"
#include "core/text_model.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vg {

// Relation kind labels
inline const std::string kSharedRootRelation = "shared_root";
inline const std::string kSharedLemmaRelation = "shared_lemma";
inline const std::string kIdenticalNormalizedRelation = "identical_normalized";

/**
 * @brief A weighted, symmetric link between two words sharing a feature
 *
 * The pair is unordered: other() works from either member. Weight must lie in
 * [0, 1] and the kind label must be non-empty.
 */
class WordRelation {
public:
    /**
     * @throws std::invalid_argument on an empty kind or a weight outside [0, 1]
     */
    WordRelation(Word first, Word second, std::string kind, double weight = 1.0,
                 std::optional<std::map<std::string, std::string>> metadata = std::nullopt);

    const Word& first() const { return first_; }
    const Word& second() const { return second_; }
    const std::string& kind() const { return kind_; }
    double weight() const { return weight_; }
    const std::optional<std::map<std::string, std::string>>& metadata() const { return metadata_; }

    /**
     * @brief Check if a word (by location) is a member of this relation
     */
    bool involves(const Word& word) const;

    /**
     * @brief The member that is not the given word
     * @return The other word, or nullopt if the given word is not a member
     */
    std::optional<Word> other(const Word& word) const;

    std::string to_string() const;
    nlohmann::json to_json() const;

    bool operator==(const WordRelation& other) const;
    bool operator!=(const WordRelation& other) const { return !(*this == other); }

private:
    Word first_;
    Word second_;
    std::string kind_;
    double weight_;
    std::optional<std::map<std::string, std::string>> metadata_;
};

/**
 * @brief Default weight per relation pass
 */
struct RelationWeights {
    double root = kSharedRootWeight;
    double lemma = kSharedLemmaWeight;
    double normalized = kNormalizedFormWeight;

    static RelationWeights from_config(const CorpusConfig& config);
};

/**
 * @brief Accumulates relations between words sharing a feature
 *
 * Each build pass groups the input by one feature and emits one relation per
 * unordered pair inside each group, so a group of n words yields n*(n-1)/2
 * relations. That is quadratic in the group size; very common surface forms
 * dominate the cost of the normalized-text pass. Passes are additive and can be
 * combined freely before reading the result.
 */
class RelationBuilder {
public:
    RelationBuilder() = default;

    void add_relation(const Word& first, const Word& second, const std::string& kind,
                      double weight = 1.0,
                      std::optional<std::map<std::string, std::string>> metadata = std::nullopt);

    /**
     * @brief Relate words with the same (present) root
     *
     * Metadata carries the shared root under "root".
     */
    void build_root_relations(const std::vector<Word>& words, double weight = kSharedRootWeight);

    /**
     * @brief Relate words with the same (present) lemma
     */
    void build_lemma_relations(const std::vector<Word>& words, double weight = kSharedLemmaWeight);

    /**
     * @brief Relate words with identical normalized text
     *
     * Only groups with more than one member produce relations.
     */
    void build_normalized_relations(const std::vector<Word>& words,
                                    double weight = kNormalizedFormWeight);

    const std::vector<WordRelation>& get_all() const { return relations_; }
    size_t count() const { return relations_.size(); }
    void clear() { relations_.clear(); }

private:
    std::vector<WordRelation> relations_;

    void add_group_pairs(const std::vector<const Word*>& group,
                         const std::string& kind,
                         double weight,
                         const std::string& metadata_key,
                         const std::string& feature);
};

} // namespace vg
