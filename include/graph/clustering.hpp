#pragma once

#include "core/text_model.hpp"
#include "graph/word_graph.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vg {

/**
 * @brief Size summary of a set of word clusters
 */
struct ClusterStatistics {
    size_t num_clusters = 0;
    size_t total_words = 0;
    double avg_cluster_size = 0.0;
    size_t max_cluster_size = 0;
    size_t min_cluster_size = 0;

    nlohmann::json to_json() const;
};

// ==========================================
// Feature clusters
// ==========================================

/**
 * @brief Group words by root; words without a root are left out
 */
std::map<std::string, std::vector<Word>> cluster_by_root(const std::vector<Word>& words);

/**
 * @brief Group words by lemma; words without a lemma are left out
 */
std::map<std::string, std::vector<Word>> cluster_by_lemma(const std::vector<Word>& words);

std::map<int, std::vector<Word>> cluster_by_chapter(const std::vector<Word>& words);

// ==========================================
// Structural clusters
// ==========================================

/**
 * @brief Connected components of a word graph
 *
 * Components are ordered by their earliest word in text order, and words
 * inside a component are in text order. Components smaller than
 * min_cluster_size are dropped.
 */
std::vector<std::vector<Word>> cluster_by_connectivity(const WordGraph& graph,
                                                       size_t min_cluster_size = 2);

// ==========================================
// Statistics
// ==========================================

ClusterStatistics compute_cluster_statistics(const std::map<std::string, std::vector<Word>>& clusters);
ClusterStatistics compute_cluster_statistics(const std::map<int, std::vector<Word>>& clusters);
ClusterStatistics compute_cluster_statistics(const std::vector<std::vector<Word>>& clusters);

} // namespace vg
