#include <gtest/gtest.h>
#include <limits>
#include "../include/digraph.hpp"
#include "../include/line_reader.hpp"
#include "test_helpers.hpp"

using routemap::WeightedDigraph;
using routemap::InvalidInput;

class DigraphTest : public ::testing::Test {
protected:
    WeightedDigraph graph;
};

// === CONSTRUCTION ===

TEST_F(DigraphTest, EmptyGraph) {
    EXPECT_EQ(graph.getNumNodes(), 0u);
    EXPECT_EQ(graph.getNumEdges(), 0u);
    EXPECT_FALSE(graph.has_node("A"));
    EXPECT_FALSE(graph.node_id("A").has_value());
}

TEST_F(DigraphTest, NodesCreatedImplicitly) {
    graph.add_edge("A", "B", 5);

    EXPECT_EQ(graph.getNumNodes(), 2u);
    EXPECT_TRUE(graph.has_node("A"));
    EXPECT_TRUE(graph.has_node("B"));
    EXPECT_EQ(graph.node_name(*graph.node_id("A")), "A");
}

TEST_F(DigraphTest, EdgesAreDirected) {
    graph.add_edge("A", "B", 5);
    const auto a = *graph.node_id("A");
    const auto b = *graph.node_id("B");

    EXPECT_EQ(graph.edge_weight(a, b), 5u);
    EXPECT_FALSE(graph.edge_weight(b, a).has_value());
}

TEST_F(DigraphTest, SecondDefinitionOverwrites) {
    graph.add_edge("A", "B", 5);
    graph.add_edge("A", "B", 11);
    const auto a = *graph.node_id("A");
    const auto b = *graph.node_id("B");

    EXPECT_EQ(graph.getNumEdges(), 1u);
    EXPECT_EQ(graph.successors(a).size(), 1u);
    EXPECT_EQ(graph.edge_weight(a, b), 11u);
    EXPECT_EQ(graph.getTotalWeight(), 11u);
}

TEST_F(DigraphTest, MultiCharacterTokens) {
    graph.add_edge("Union", "Central", 3);
    EXPECT_TRUE(graph.has_node("Union"));
    EXPECT_EQ(graph.edge_weight(*graph.node_id("Union"), *graph.node_id("Central")), 3u);
}

TEST_F(DigraphTest, EmptyNameRejected) {
    EXPECT_THROW(graph.add_edge("", "B", 1), InvalidInput);
}

TEST_F(DigraphTest, OversizedWeightRejected) {
    graph.add_edge("A", "B", routemap::MAX_EDGE_WEIGHT);
    EXPECT_EQ(graph.edge_weight(*graph.node_id("A"), *graph.node_id("B")), routemap::MAX_EDGE_WEIGHT);
    EXPECT_THROW(graph.add_edge("A", "C", routemap::MAX_EDGE_WEIGHT + 1), InvalidInput);
    EXPECT_THROW(graph.add_edge("B", "C", std::numeric_limits<routemap::Weight>::max()), InvalidInput);
}

TEST_F(DigraphTest, SuccessorsKeepInsertionOrder) {
    graph = test_utils::create_sample_graph();
    const auto& arcs = graph.successors(*graph.node_id("A"));

    ASSERT_EQ(arcs.size(), 3u);
    EXPECT_EQ(graph.node_name(arcs[0].to), "B");
    EXPECT_EQ(graph.node_name(arcs[1].to), "D");
    EXPECT_EQ(graph.node_name(arcs[2].to), "E");
}

TEST_F(DigraphTest, Statistics) {
    graph = test_utils::create_sample_graph();

    EXPECT_EQ(graph.getNumNodes(), 5u);
    EXPECT_EQ(graph.getNumEdges(), 9u);
    EXPECT_EQ(graph.getTotalWeight(), 48u);
    EXPECT_EQ(graph.getMinWeight(), 2u);
    EXPECT_EQ(graph.getMaxWeight(), 8u);
    EXPECT_EQ(graph.getMaxOutDeg(), 3u);
}

// === QUERIES ===

TEST_F(DigraphTest, Reachability) {
    graph = test_utils::create_sample_graph();
    graph.add_edge("X", "A", 1);
    const auto a = *graph.node_id("A");
    const auto x = *graph.node_id("X");
    const auto c = *graph.node_id("C");

    EXPECT_TRUE(graph.has_path(x, c));
    EXPECT_FALSE(graph.has_path(c, x));
    EXPECT_FALSE(graph.has_path(c, a));
    EXPECT_TRUE(graph.has_path(a, a));
}

TEST_F(DigraphTest, ShortestPathLength) {
    graph = test_utils::create_sample_graph();
    auto id = [&](const char* n) { return *graph.node_id(n); };

    EXPECT_EQ(graph.shortest_path_length(id("A"), id("C")), 9u);
    EXPECT_EQ(graph.shortest_path_length(id("A"), id("E")), 7u);
    EXPECT_EQ(graph.shortest_path_length(id("C"), id("B")), 5u);
    EXPECT_EQ(graph.shortest_path_length(id("B"), id("B")), 0u);
    EXPECT_FALSE(graph.shortest_path_length(id("C"), id("A")).has_value());
}

TEST_F(DigraphTest, RouteToString) {
    graph = test_utils::create_sample_graph();
    const auto r = test_utils::route_of(graph, "AEBC");

    EXPECT_EQ(graph.route_to_string(r), "AEBC");
    EXPECT_EQ(graph.route_to_string(r, "-"), "A-E-B-C");
}

// === LOADING ===

TEST_F(DigraphTest, LoadPlainEdgeList) {
    const std::string path = test_utils::write_text_file("plain_edges.txt", "AB5\nBC4\r\n\n# comment\nCD12\n");
    graph.load_from_edge_list(path);

    EXPECT_EQ(graph.getNumNodes(), 4u);
    EXPECT_EQ(graph.getNumEdges(), 3u);
    EXPECT_EQ(graph.edge_weight(*graph.node_id("C"), *graph.node_id("D")), 12u);
}

TEST_F(DigraphTest, LoadLastLineWithoutNewline) {
    const std::string path = test_utils::write_text_file("no_eol.txt", "AB5\nBA7");
    graph.load_from_edge_list(path);

    EXPECT_EQ(graph.edge_weight(*graph.node_id("B"), *graph.node_id("A")), 7u);
}

TEST_F(DigraphTest, LoadGzipEdgeList) {
    const std::string path = test_utils::write_gz_file("edges.txt.gz", "AB5\nBC4\nCD8\nDC8\nDE6\nAD5\nCE2\nEB3\nAE7\n");
    graph.load_from_edge_list(path);

    EXPECT_EQ(graph.getNumNodes(), 5u);
    EXPECT_EQ(graph.getNumEdges(), 9u);
}

TEST_F(DigraphTest, LoadSampleDataFile) {
    graph.load_from_edge_list(std::string(ROUTEMAP_TEST_DATA_DIR) + "/sample_graph.txt");

    EXPECT_EQ(graph.getNumEdges(), 9u);
    EXPECT_EQ(graph.getTotalWeight(), 48u);
}

TEST_F(DigraphTest, MissingFileThrows) {
    EXPECT_THROW(graph.load_from_edge_list(test_utils::temp_path("does_not_exist.txt")), std::runtime_error);
}

TEST_F(DigraphTest, MalformedLinesRejected) {
    const std::vector<std::string> bad = {"A\n", "AB\n", "ABx\n", "AB-3\n", "AB5x\n", "A 5\n", "AB99999999999999999999999\n",
                                          "AB4294967296\n", "AB18446744073709551615\n"};
    for (size_t i = 0; i < bad.size(); ++i) {
        WeightedDigraph g;
        const std::string path = test_utils::write_text_file("bad_" + std::to_string(i) + ".txt", bad[i]);
        EXPECT_THROW(g.load_from_edge_list(path), InvalidInput) << "line: " << bad[i];
    }
}

TEST_F(DigraphTest, MalformedLineReportsLocation) {
    const std::string path = test_utils::write_text_file("bad_location.txt", "AB5\nBCx\n");
    try {
        graph.load_from_edge_list(path);
        FAIL() << "expected InvalidInput";
    } catch (const InvalidInput& e) {
        EXPECT_NE(std::string(e.what()).find(":2:"), std::string::npos) << e.what();
    }
}

TEST(LineReaderTest, ReadsLongLines) {
    const std::string long_line(200000, 'x');
    const std::string path = test_utils::write_text_file("long_line.txt", long_line + "\nshort\n");

    routemap::LineReader reader(path, 1024);
    std::string line;
    ASSERT_TRUE(reader.getline(line));
    EXPECT_EQ(line.size(), long_line.size());
    ASSERT_TRUE(reader.getline(line));
    EXPECT_EQ(line, "short");
    EXPECT_EQ(reader.line_number(), 2u);
    EXPECT_FALSE(reader.getline(line));
}
