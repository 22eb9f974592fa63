#include "graph/word_graph.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace vg {

// ==========================================
// WordNode / WordEdge / GraphStatistics
// ==========================================

nlohmann::json WordNode::to_json() const {
    nlohmann::json j = word.to_json();
    j["id"] = word.location().to_string();
    if (!attributes.empty()) {
        j["attributes"] = attributes;
    }
    return j;
}

nlohmann::json WordEdge::to_json() const {
    return {
        {"source", first.location().to_string()},
        {"target", second.location().to_string()},
        {"weight", weight},
        {"kind", kind}
    };
}

nlohmann::json GraphStatistics::to_json() const {
    return {
        {"num_nodes", num_nodes},
        {"num_edges", num_edges},
        {"avg_degree", avg_degree},
        {"max_degree", max_degree},
        {"min_degree", min_degree},
        {"num_isolated_nodes", num_isolated_nodes},
        {"edges_by_kind", edges_by_kind}
    };
}

// ==========================================
// WordGraph Implementation
// ==========================================

bool WordGraph::add_node(const Word& word, const std::map<std::string, std::string>& attributes) {
    bool inserted = nodes_.emplace(word.location(), WordNode{word, attributes}).second;
    if (inserted) {
        node_to_edges_[word.location()];
    }
    return inserted;
}

void WordGraph::add_edge(const Word& first, const Word& second, double weight,
                         const std::string& kind) {
    if (std::isnan(weight) || weight < 0.0 || weight > 1.0) {
        std::ostringstream ss;
        ss << "Edge weight must be between 0.0 and 1.0, got " << weight;
        throw GraphBuildError(ss.str());
    }
    if (kind.empty()) {
        throw GraphBuildError("Edge kind cannot be empty");
    }

    add_node(first);
    add_node(second);

    size_t index = edges_.size();
    edges_.push_back(WordEdge{first, second, weight, kind});

    node_to_edges_[first.location()].push_back(index);
    if (second.location() != first.location()) {
        node_to_edges_[second.location()].push_back(index);
    }
}

std::vector<Word> WordGraph::neighbors(const Word& word) const {
    std::vector<Word> result;

    auto it = node_to_edges_.find(word.location());
    if (it == node_to_edges_.end()) {
        return result;
    }

    for (size_t index : it->second) {
        const auto& edge = edges_[index];
        if (edge.first.location() == word.location()) {
            result.push_back(edge.second);
        } else {
            result.push_back(edge.first);
        }
    }

    return result;
}

std::vector<WordEdge> WordGraph::edges_for(const Word& word) const {
    std::vector<WordEdge> result;

    auto it = node_to_edges_.find(word.location());
    if (it == node_to_edges_.end()) {
        return result;
    }

    result.reserve(it->second.size());
    for (size_t index : it->second) {
        result.push_back(edges_[index]);
    }
    return result;
}

size_t WordGraph::degree(const Word& word) const {
    auto it = node_to_edges_.find(word.location());
    return it == node_to_edges_.end() ? 0 : it->second.size();
}

bool WordGraph::has_node(const Word& word) const {
    return nodes_.find(word.location()) != nodes_.end();
}

const std::map<std::string, std::string>* WordGraph::node_attributes(const Word& word) const {
    auto it = nodes_.find(word.location());
    return it == nodes_.end() ? nullptr : &it->second.attributes;
}

std::vector<Word> WordGraph::nodes() const {
    std::vector<Word> result;
    result.reserve(nodes_.size());
    for (const auto& [location, node] : nodes_) {
        result.push_back(node.word);
    }
    return result;
}

WordGraph WordGraph::subgraph(const std::vector<Word>& words) const {
    WordGraph sub;

    std::set<WordLocation> keep;
    for (const auto& word : words) {
        auto it = nodes_.find(word.location());
        if (it != nodes_.end()) {
            keep.insert(word.location());
            sub.add_node(it->second.word, it->second.attributes);
        }
    }

    for (const auto& edge : edges_) {
        if (keep.count(edge.first.location()) && keep.count(edge.second.location())) {
            sub.add_edge(edge.first, edge.second, edge.weight, edge.kind);
        }
    }

    return sub;
}

GraphStatistics WordGraph::compute_statistics() const {
    GraphStatistics stats;

    stats.num_nodes = nodes_.size();
    stats.num_edges = edges_.size();

    for (const auto& edge : edges_) {
        stats.edges_by_kind[edge.kind]++;
    }

    if (nodes_.empty()) {
        return stats;
    }

    size_t total_degree = 0;
    stats.max_degree = 0;
    stats.min_degree = std::numeric_limits<size_t>::max();

    for (const auto& [location, incident] : node_to_edges_) {
        size_t d = incident.size();
        total_degree += d;
        stats.max_degree = std::max(stats.max_degree, d);
        stats.min_degree = std::min(stats.min_degree, d);
        if (d == 0) {
            stats.num_isolated_nodes++;
        }
    }

    stats.avg_degree = static_cast<double>(total_degree) / nodes_.size();

    return stats;
}

std::vector<std::pair<Word, size_t>> WordGraph::top_hubs(size_t k) const {
    std::vector<std::pair<Word, size_t>> hub_list;
    hub_list.reserve(nodes_.size());

    for (const auto& [location, node] : nodes_) {
        hub_list.emplace_back(node.word, node_to_edges_.at(location).size());
    }

    std::stable_sort(
        hub_list.begin(),
        hub_list.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; }
    );

    if (hub_list.size() > k) {
        hub_list.erase(hub_list.begin() + static_cast<std::ptrdiff_t>(k), hub_list.end());
    }

    return hub_list;
}

nlohmann::json WordGraph::to_json() const {
    nlohmann::json j;

    j["nodes"] = nlohmann::json::array();
    for (const auto& [location, node] : nodes_) {
        j["nodes"].push_back(node.to_json());
    }

    j["edges"] = nlohmann::json::array();
    for (const auto& edge : edges_) {
        j["edges"].push_back(edge.to_json());
    }

    j["statistics"] = compute_statistics().to_json();

    return j;
}

void WordGraph::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw ExportError("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    if (!file) {
        throw ExportError("Failed to write graph to: " + filename);
    }
}

// ==========================================
// GraphBuilder Implementation
// ==========================================

GraphBuilder::GraphBuilder(RelationWeights weights)
    : weights_(weights) {}

const WordGraph& GraphBuilder::build_from_relations(const std::vector<WordRelation>& relations) {
    WordGraph graph;

    try {
        for (const auto& relation : relations) {
            graph.add_edge(relation.first(), relation.second(), relation.weight(), relation.kind());
        }
    } catch (const std::exception&) {
        std::throw_with_nested(GraphBuildError("Failed to build graph from relations"));
    }

    graph_ = std::move(graph);
    return graph_;
}

const WordGraph& GraphBuilder::build_from_words(const std::vector<Word>& words,
                                                bool use_roots,
                                                bool use_lemmas,
                                                bool use_normalized) {
    RelationBuilder builder;

    try {
        if (use_roots) {
            builder.build_root_relations(words, weights_.root);
        }
        if (use_lemmas) {
            builder.build_lemma_relations(words, weights_.lemma);
        }
        if (use_normalized) {
            builder.build_normalized_relations(words, weights_.normalized);
        }
    } catch (const std::exception&) {
        std::throw_with_nested(GraphBuildError("Failed to build relations from words"));
    }

    return build_from_relations(builder.get_all());
}

} // namespace vg
