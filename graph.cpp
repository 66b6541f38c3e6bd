#include "graph.hpp"
#include <fmt/core.h>
#include <numeric>

std::string_view to_string(graph_errc code) {
  switch (code) {
    case graph_errc::invalid_matrix: return "invalid_matrix";
    case graph_errc::unknown_vertex: return "unknown_vertex";
  }
  return "unknown";
}

namespace {
std::unexpected<graph_error> unknown_vertex(int v, int n) {
  return std::unexpected(graph_error{
    graph_errc::unknown_vertex,
    fmt::format("vertex {} is not in the graph (vertex count {})", v, n)});
}
} // namespace

std::expected<graph, graph_error> graph::from_matrix(adjacency_matrix m) {
  const auto n = m.size();
  for (size_t row = 0; row < n; ++row) {
    if (m[row].size() != n) {
      return std::unexpected(graph_error{
        graph_errc::invalid_matrix,
        fmt::format("row {} has {} entries, expected {}", row, m[row].size(), n)});
    }
    for (size_t col = 0; col < n; ++col) {
      int cell = m[row][col];
      if (cell != 0 && cell != 1) {
        return std::unexpected(graph_error{
          graph_errc::invalid_matrix,
          fmt::format("value {} at ({}, {}) is neither 0 nor 1", cell, row, col)});
      }
    }
  }
  return graph(std::move(m));
}

std::vector<int> graph::vertices() const {
  std::vector<int> result(adj.size());
  std::iota(result.begin(), result.end(), 0);
  return result;
}

std::expected<bool, graph_error> graph::has_edge(int v1, int v2) const {
  if (!has_vertex(v1)) {
    return unknown_vertex(v1, vertex_count());
  }
  if (!has_vertex(v2)) {
    return unknown_vertex(v2, vertex_count());
  }
  return adj[v1][v2] == 1;
}

std::expected<std::vector<int>, graph_error> graph::neighbors(int v) const {
  if (!has_vertex(v)) {
    return unknown_vertex(v, vertex_count());
  }
  std::vector<int> result;
  const auto& row = adj[v];
  for (int u = 0; u < vertex_count(); ++u) {
    if (row[u] == 1) {
      result.push_back(u);
    }
  }
  return result;
}
