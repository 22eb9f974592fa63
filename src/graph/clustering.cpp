#include "graph/clustering.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <stack>

namespace {

vg::ClusterStatistics statistics_from_sizes(const std::vector<size_t>& sizes) {
    vg::ClusterStatistics stats;

    if (sizes.empty()) {
        return stats;
    }

    stats.num_clusters = sizes.size();
    stats.max_cluster_size = 0;
    stats.min_cluster_size = std::numeric_limits<size_t>::max();

    for (size_t size : sizes) {
        stats.total_words += size;
        stats.max_cluster_size = std::max(stats.max_cluster_size, size);
        stats.min_cluster_size = std::min(stats.min_cluster_size, size);
    }

    stats.avg_cluster_size = static_cast<double>(stats.total_words) / sizes.size();
    return stats;
}

template <typename Map>
std::vector<size_t> cluster_sizes(const Map& clusters) {
    std::vector<size_t> sizes;
    sizes.reserve(clusters.size());
    for (const auto& [key, words] : clusters) {
        sizes.push_back(words.size());
    }
    return sizes;
}

}  // namespace

namespace vg {

nlohmann::json ClusterStatistics::to_json() const {
    return {
        {"num_clusters", num_clusters},
        {"total_words", total_words},
        {"avg_cluster_size", avg_cluster_size},
        {"max_cluster_size", max_cluster_size},
        {"min_cluster_size", min_cluster_size}
    };
}

std::map<std::string, std::vector<Word>> cluster_by_root(const std::vector<Word>& words) {
    std::map<std::string, std::vector<Word>> clusters;
    for (const auto& word : words) {
        if (word.root().has_value()) {
            clusters[*word.root()].push_back(word);
        }
    }
    return clusters;
}

std::map<std::string, std::vector<Word>> cluster_by_lemma(const std::vector<Word>& words) {
    std::map<std::string, std::vector<Word>> clusters;
    for (const auto& word : words) {
        if (word.lemma().has_value()) {
            clusters[*word.lemma()].push_back(word);
        }
    }
    return clusters;
}

std::map<int, std::vector<Word>> cluster_by_chapter(const std::vector<Word>& words) {
    std::map<int, std::vector<Word>> clusters;
    for (const auto& word : words) {
        clusters[word.chapter()].push_back(word);
    }
    return clusters;
}

std::vector<std::vector<Word>> cluster_by_connectivity(const WordGraph& graph,
                                                       size_t min_cluster_size) {
    std::map<WordLocation, Word> words;
    std::map<WordLocation, std::vector<WordLocation>> adjacency;

    for (const auto& word : graph.nodes()) {
        words.emplace(word.location(), word);
        adjacency[word.location()];
    }
    for (const auto& edge : graph.edges()) {
        adjacency[edge.first.location()].push_back(edge.second.location());
        adjacency[edge.second.location()].push_back(edge.first.location());
    }

    std::set<WordLocation> visited;
    std::vector<std::vector<Word>> components;

    for (const auto& [start, neighbors] : adjacency) {
        if (visited.count(start)) continue;

        // DFS to collect the component
        std::vector<WordLocation> component;
        std::stack<WordLocation> stack;
        stack.push(start);

        while (!stack.empty()) {
            WordLocation current = stack.top();
            stack.pop();

            if (visited.count(current)) continue;

            visited.insert(current);
            component.push_back(current);

            for (const auto& neighbor : adjacency[current]) {
                if (!visited.count(neighbor)) {
                    stack.push(neighbor);
                }
            }
        }

        if (component.size() < min_cluster_size) {
            continue;
        }

        std::sort(component.begin(), component.end());

        std::vector<Word> cluster;
        cluster.reserve(component.size());
        for (const auto& location : component) {
            cluster.push_back(words.at(location));
        }
        components.push_back(std::move(cluster));
    }

    return components;
}

ClusterStatistics compute_cluster_statistics(const std::map<std::string, std::vector<Word>>& clusters) {
    return statistics_from_sizes(cluster_sizes(clusters));
}

ClusterStatistics compute_cluster_statistics(const std::map<int, std::vector<Word>>& clusters) {
    return statistics_from_sizes(cluster_sizes(clusters));
}

ClusterStatistics compute_cluster_statistics(const std::vector<std::vector<Word>>& clusters) {
    std::vector<size_t> sizes;
    sizes.reserve(clusters.size());
    for (const auto& cluster : clusters) {
        sizes.push_back(cluster.size());
    }
    return statistics_from_sizes(sizes);
}

} // namespace vg
