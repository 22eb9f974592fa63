#include <gtest/gtest.h>
#include "graph/clustering.hpp"
#include "test_fixtures.hpp"

using namespace vg;
using vg::testing::make_word;

class ClusteringTest : public ::testing::Test {
protected:
    std::vector<Word> words = {
        make_word(1, 1, 0, "a", std::string("r1"), std::string("l1")),
        make_word(1, 1, 1, "b", std::string("r2")),
        make_word(1, 2, 0, "c", std::string("r1"), std::string("l1")),
        make_word(2, 1, 0, "d", std::string("r1")),
        make_word(2, 1, 1, "e")
    };
};

// ==========================================
// Feature Clusters
// ==========================================

TEST_F(ClusteringTest, ByRoot) {
    auto clusters = cluster_by_root(words);
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters.at("r1").size(), 3u);
    EXPECT_EQ(clusters.at("r2").size(), 1u);
    EXPECT_EQ(clusters.at("r1")[2], words[3]);
}

TEST_F(ClusteringTest, ByLemma) {
    auto clusters = cluster_by_lemma(words);
    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters.at("l1").size(), 2u);
}

TEST_F(ClusteringTest, ByChapter) {
    auto clusters = cluster_by_chapter(words);
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters.at(1).size(), 3u);
    EXPECT_EQ(clusters.at(2).size(), 2u);
}

TEST_F(ClusteringTest, EmptyInput) {
    EXPECT_TRUE(cluster_by_root({}).empty());
    EXPECT_TRUE(cluster_by_chapter({}).empty());
}

// ==========================================
// Connectivity
// ==========================================

TEST_F(ClusteringTest, ConnectedComponentsInTextOrder) {
    WordGraph graph;
    graph.add_edge(words[3], words[0], 1.0, "k");   // d - a
    graph.add_edge(words[2], words[3], 1.0, "k");   // c - d
    graph.add_edge(words[1], words[4], 1.0, "k");   // b - e

    auto components = cluster_by_connectivity(graph);
    ASSERT_EQ(components.size(), 2u);

    ASSERT_EQ(components[0].size(), 3u);
    EXPECT_EQ(components[0][0], words[0]);
    EXPECT_EQ(components[0][1], words[2]);
    EXPECT_EQ(components[0][2], words[3]);

    ASSERT_EQ(components[1].size(), 2u);
    EXPECT_EQ(components[1][0], words[1]);
}

TEST_F(ClusteringTest, MinimumClusterSize) {
    WordGraph graph;
    graph.add_edge(words[0], words[2], 1.0, "k");
    graph.add_node(words[4]);

    EXPECT_EQ(cluster_by_connectivity(graph).size(), 1u);
    EXPECT_EQ(cluster_by_connectivity(graph, 1).size(), 2u);
    EXPECT_EQ(cluster_by_connectivity(graph, 3).size(), 0u);
}

TEST_F(ClusteringTest, EmptyGraphHasNoClusters) {
    EXPECT_TRUE(cluster_by_connectivity(WordGraph()).empty());
}

// ==========================================
// Statistics
// ==========================================

TEST_F(ClusteringTest, Statistics) {
    auto stats = compute_cluster_statistics(cluster_by_chapter(words));
    EXPECT_EQ(stats.num_clusters, 2u);
    EXPECT_EQ(stats.total_words, 5u);
    EXPECT_DOUBLE_EQ(stats.avg_cluster_size, 2.5);
    EXPECT_EQ(stats.max_cluster_size, 3u);
    EXPECT_EQ(stats.min_cluster_size, 2u);
}

TEST_F(ClusteringTest, EmptyStatistics) {
    auto stats = compute_cluster_statistics(std::map<std::string, std::vector<Word>>{});
    EXPECT_EQ(stats.num_clusters, 0u);
    EXPECT_EQ(stats.min_cluster_size, 0u);
    EXPECT_DOUBLE_EQ(stats.avg_cluster_size, 0.0);
    EXPECT_EQ(stats.to_json()["num_clusters"], 0);
}

TEST_F(ClusteringTest, ComponentStatistics) {
    std::vector<std::vector<Word>> clusters = {{words[0], words[1]}, {words[2]}};
    auto stats = compute_cluster_statistics(clusters);
    EXPECT_EQ(stats.num_clusters, 2u);
    EXPECT_EQ(stats.max_cluster_size, 2u);
    EXPECT_EQ(stats.min_cluster_size, 1u);
}
