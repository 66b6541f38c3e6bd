#pragma once
#include "graph.hpp"
#include "timer.hpp"
#include <expected>
#include <future>
#include <string>
#include <string_view>
#include <vector>

enum class traversal_errc {
  invalid_worker_count,
  worker_start_failure,
  task_failure,
};

std::string_view to_string(traversal_errc code);

struct traversal_error {
  traversal_errc code;
  std::string message;
};

struct single_vertex_result {
  int start;
  bfs_traversal traversal;
  dmilliseconds elapsed;
  int worker_id;
};

struct all_vertices_result {
  // One entry per vertex, ascending by start vertex.
  std::vector<single_vertex_result> results;
  dmilliseconds total_elapsed{0};
  int worker_count = 0;

  // Number of distinct workers that ran at least one traversal.
  int workers_used() const;
};

// Runs bfs_from for every vertex of g on a pool of worker_count threads and
// blocks until all traversals are done. The pool is gone by the time this
// returns. There is no cancellation: a traversal that never finishes blocks
// the caller forever.
std::expected<all_vertices_result, traversal_error>
traverse_from_all_vertices(const graph& g, int worker_count);

namespace detail {
// futures[v] holds the traversal from vertex v. Every future is waited on,
// even after one has failed, and the first failure in vertex order is
// returned as task_failure.
std::expected<std::vector<single_vertex_result>, traversal_error>
collect_results(std::vector<std::future<single_vertex_result>>& futures);
} // namespace detail
