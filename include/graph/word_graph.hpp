#pragma once

#include "core/text_model.hpp"
#include "graph/word_relation.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace vg {

/**
 * @brief A word registered in the graph with free-form attributes
 */
struct WordNode {
    Word word;
    std::map<std::string, std::string> attributes;

    nlohmann::json to_json() const;
};

/**
 * @brief An undirected weighted edge between two words
 *
 * Parallel edges between the same pair are kept: one edge per relation.
 */
struct WordEdge {
    Word first;
    Word second;
    double weight = 1.0;
    std::string kind;

    bool involves(const WordLocation& location) const {
        return first.location() == location || second.location() == location;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Statistics about the word graph structure
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;

    double avg_degree = 0.0;
    size_t max_degree = 0;
    size_t min_degree = 0;
    size_t num_isolated_nodes = 0;

    std::map<std::string, size_t> edges_by_kind;

    nlohmann::json to_json() const;
};

/**
 * @brief Graph whose nodes are words and whose edges are word relations
 *
 * Nodes are keyed by word location (chapter, verse, position), so two words
 * are the same node exactly when they occupy the same place in the text.
 * Node iteration is in text order.
 */
class WordGraph {
public:
    WordGraph() = default;

    // ==========================================
    // Construction
    // ==========================================

    /**
     * @brief Register a word as a node
     *
     * An existing node with the same location is left untouched.
     * @return true if the node was added
     */
    bool add_node(const Word& word, const std::map<std::string, std::string>& attributes = {});

    /**
     * @brief Add an edge, registering both endpoints as nodes
     * @throws GraphBuildError on an empty kind or a weight outside [0, 1]
     */
    void add_edge(const Word& first, const Word& second, double weight = 1.0,
                  const std::string& kind = "unknown");

    // ==========================================
    // Queries
    // ==========================================

    /**
     * @brief Words connected to a word, one entry per incident edge
     *
     * A pair linked by several relations appears once per relation.
     */
    std::vector<Word> neighbors(const Word& word) const;

    /**
     * @brief All edges incident to a word, in insertion order
     */
    std::vector<WordEdge> edges_for(const Word& word) const;

    /**
     * @brief Number of incident edges (not distinct neighbors)
     */
    size_t degree(const Word& word) const;

    bool has_node(const Word& word) const;

    /**
     * @brief Attributes of a node
     * @return Pointer to the attributes, or nullptr if the word is not a node
     */
    const std::map<std::string, std::string>* node_attributes(const Word& word) const;

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    /**
     * @brief All node words in text order
     */
    std::vector<Word> nodes() const;

    const std::vector<WordEdge>& edges() const { return edges_; }

    /**
     * @brief Induced subgraph over the given words
     *
     * Keeps the given words that are nodes of this graph, and every edge
     * whose endpoints are both kept.
     */
    WordGraph subgraph(const std::vector<Word>& words) const;

    // ==========================================
    // Analysis
    // ==========================================

    GraphStatistics compute_statistics() const;

    /**
     * @brief Highest-degree nodes, ties broken by text order
     */
    std::vector<std::pair<Word, size_t>> top_hubs(size_t k = 20) const;

    // ==========================================
    // Serialization
    // ==========================================

    nlohmann::json to_json() const;

    /**
     * @throws ExportError if the file cannot be written
     */
    void export_to_json(const std::string& filename) const;

private:
    std::map<WordLocation, WordNode> nodes_;
    std::vector<WordEdge> edges_;
    std::map<WordLocation, std::vector<size_t>> node_to_edges_;
};

/**
 * @brief Builds word graphs from relations or directly from words
 *
 * Every build starts from an empty graph; earlier results are discarded.
 */
class GraphBuilder {
public:
    explicit GraphBuilder(RelationWeights weights = {});

    /**
     * @brief One edge per relation, endpoints registered as nodes
     * @throws GraphBuildError wrapping the underlying failure
     */
    const WordGraph& build_from_relations(const std::vector<WordRelation>& relations);

    /**
     * @brief Run the selected relation passes over the words and build from them
     * @throws GraphBuildError wrapping the underlying failure
     */
    const WordGraph& build_from_words(const std::vector<Word>& words,
                                      bool use_roots = true,
                                      bool use_lemmas = true,
                                      bool use_normalized = true);

    const WordGraph& graph() const { return graph_; }
    const RelationWeights& weights() const { return weights_; }

private:
    RelationWeights weights_;
    WordGraph graph_;
};

} // namespace vg
