#pragma once
#include "graph.hpp"
#include "graph_io.hpp"
#include <cstdint>
#include <expected>
#include <fmt/core.h>
#include <random>

struct xorshift128 {
  using result_type = uint64_t;
  constexpr static result_type max() { return UINT64_MAX; }
  constexpr static result_type min() { return 0; }

  explicit xorshift128() = default;
  explicit xorshift128(uint64_t s): a(s), b(s) {}
  explicit xorshift128(uint64_t a, uint64_t b): a(a), b(b) {}

  uint64_t a = 0xfe48ec23c5fb18e0;
  uint64_t b = 0xac5f64acb55eda12;

  result_type operator()() {
    uint64_t x = a, y = b;
    a = b;
    x ^= x << 23;
    b = x ^ y ^ (x >> 17) ^ (y >> 26);
    return b + y;
  }
};

// Undirected graph with every edge drawn by an independent coin flip. The
// diagonal is drawn too, so self-loops can occur.
template<typename Rng>
std::expected<graph, io_error> random_graph(Rng& rng, int n_verts) {
  if (n_verts < 0) {
    return std::unexpected(io_error{
      io_errc::negative_vertex_count,
      fmt::format("graph cannot have a negative number of vertices ({})", n_verts)});
  }

  adjacency_matrix m(n_verts, std::vector<int>(n_verts, 0));
  std::uniform_int_distribution<int> coin(0, 1);
  for (int i = 0; i < n_verts; ++i) {
    for (int j = 0; j <= i; ++j) {
      m[i][j] = m[j][i] = coin(rng);
    }
  }
  return graph::from_matrix(std::move(m)).value();
}
