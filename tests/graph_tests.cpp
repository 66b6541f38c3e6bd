#include <gtest/gtest.h>
#include "graph.hpp"

// =============================================================================
// Construction
// =============================================================================

TEST(GraphConstructionTests, FromMatrix_AcceptsSquareBinaryMatrix) {
  auto g = graph::from_matrix({{0, 1, 0}, {1, 0, 1}, {0, 1, 1}});
  ASSERT_TRUE(g.has_value());
  EXPECT_EQ(g->vertex_count(), 3);
}

TEST(GraphConstructionTests, FromMatrix_AcceptsEmptyMatrix) {
  auto g = graph::from_matrix({});
  ASSERT_TRUE(g.has_value());
  EXPECT_EQ(g->vertex_count(), 0);
  EXPECT_EQ(*g, graph::empty());
}

TEST(GraphConstructionTests, FromMatrix_AcceptsSelfLoops) {
  auto g = graph::from_matrix({{1, 0}, {0, 1}});
  ASSERT_TRUE(g.has_value());
  EXPECT_TRUE(g->has_edge(0, 0).value());
}

TEST(GraphConstructionTests, FromMatrix_RejectsShortRow) {
  auto g = graph::from_matrix({{0, 1}, {1}});
  ASSERT_FALSE(g.has_value());
  EXPECT_EQ(g.error().code, graph_errc::invalid_matrix);
  EXPECT_NE(g.error().message.find("row 1"), std::string::npos);
}

TEST(GraphConstructionTests, FromMatrix_RejectsNonSquareMatrix) {
  auto g = graph::from_matrix({{0, 1, 0}, {1, 0, 1}});
  ASSERT_FALSE(g.has_value());
  EXPECT_EQ(g.error().code, graph_errc::invalid_matrix);
}

TEST(GraphConstructionTests, FromMatrix_RejectsValueOutsideZeroOne) {
  for (int bad: {2, -1, 7}) {
    auto g = graph::from_matrix({{0, 1}, {bad, 0}});
    ASSERT_FALSE(g.has_value()) << "value " << bad;
    EXPECT_EQ(g.error().code, graph_errc::invalid_matrix);
  }
}

// =============================================================================
// Queries
// =============================================================================

class GraphQueryTests : public ::testing::Test {
protected:
  // 0 -> 1, 0 -> 2, 2 -> 2, 3 isolated
  graph g = graph::from_matrix({
    {0, 1, 1, 0},
    {0, 0, 0, 0},
    {0, 0, 1, 0},
    {0, 0, 0, 0},
  }).value();
};

TEST_F(GraphQueryTests, Vertices_AreAscendingRowIndices) {
  EXPECT_EQ(g.vertices(), (std::vector<int>{0, 1, 2, 3}));
  EXPECT_TRUE(graph::empty().vertices().empty());
}

TEST_F(GraphQueryTests, HasVertex_MatchesRange) {
  EXPECT_TRUE(g.has_vertex(0));
  EXPECT_TRUE(g.has_vertex(3));
  EXPECT_FALSE(g.has_vertex(4));
  EXPECT_FALSE(g.has_vertex(-1));
  EXPECT_FALSE(graph::empty().has_vertex(0));
}

TEST_F(GraphQueryTests, HasEdge_IsDirected) {
  EXPECT_TRUE(g.has_edge(0, 1).value());
  EXPECT_FALSE(g.has_edge(1, 0).value());
  EXPECT_TRUE(g.has_edge(2, 2).value());
}

TEST_F(GraphQueryTests, HasEdge_UnknownVertexFails) {
  auto first = g.has_edge(4, 0);
  ASSERT_FALSE(first.has_value());
  EXPECT_EQ(first.error().code, graph_errc::unknown_vertex);
  EXPECT_NE(first.error().message.find("vertex 4"), std::string::npos);

  auto second = g.has_edge(0, -3);
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().code, graph_errc::unknown_vertex);
  EXPECT_NE(second.error().message.find("vertex -3"), std::string::npos);
}

TEST_F(GraphQueryTests, Neighbors_ReturnsOutgoingEdgesAscending) {
  EXPECT_EQ(g.neighbors(0).value(), (std::vector<int>{1, 2}));
  EXPECT_TRUE(g.neighbors(1).value().empty());
  EXPECT_EQ(g.neighbors(2).value(), (std::vector<int>{2}));
}

TEST_F(GraphQueryTests, Neighbors_UnknownVertexFails) {
  for (int v: {-1, 4, 100}) {
    auto n = g.neighbors(v);
    ASSERT_FALSE(n.has_value()) << "vertex " << v;
    EXPECT_EQ(n.error().code, graph_errc::unknown_vertex);
  }
  EXPECT_FALSE(graph::empty().neighbors(0).has_value());
}

TEST(GraphErrorTests, ToString_NamesEachCode) {
  EXPECT_EQ(to_string(graph_errc::invalid_matrix), "invalid_matrix");
  EXPECT_EQ(to_string(graph_errc::unknown_vertex), "unknown_vertex");
}
