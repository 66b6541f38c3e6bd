#pragma once
#include <expected>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using adjacency_matrix = std::vector<std::vector<int>>;
using bfs_traversal = std::vector<int>;

enum class graph_errc {
  invalid_matrix,
  unknown_vertex,
};

std::string_view to_string(graph_errc code);

struct graph_error {
  graph_errc code;
  std::string message;
};

// Dense adjacency matrix. Immutable once built, so it can be read from any
// number of threads without locking.
class graph {
  adjacency_matrix adj;

  explicit graph(adjacency_matrix m): adj(std::move(m)) {}

public:
  static std::expected<graph, graph_error> from_matrix(adjacency_matrix m);
  static graph empty() { return graph(adjacency_matrix{}); }

  int vertex_count() const { return std::ssize(adj); }

  bool has_vertex(int v) const { return 0 <= v && v < vertex_count(); }

  std::vector<int> vertices() const;

  std::expected<bool, graph_error> has_edge(int v1, int v2) const;

  // Ascending by vertex id. A self-loop makes v its own neighbor.
  std::expected<std::vector<int>, graph_error> neighbors(int v) const;

  const adjacency_matrix& matrix() const { return adj; }

  friend bool operator==(const graph&, const graph&) = default;
};

// Visitation order of a breadth-first search from start, which must be a
// vertex of g. Neighbors are expanded in ascending order.
bfs_traversal bfs_from(const graph& g, int start);
