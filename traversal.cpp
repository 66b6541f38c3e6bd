#include "traversal.hpp"
#include "log.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <exception>
#include <fmt/chrono.h>
#include <future>
#include <optional>

std::string_view to_string(traversal_errc code) {
  switch (code) {
    case traversal_errc::invalid_worker_count: return "invalid_worker_count";
    case traversal_errc::worker_start_failure: return "worker_start_failure";
    case traversal_errc::task_failure: return "task_failure";
  }
  return "unknown";
}

int all_vertices_result::workers_used() const {
  std::vector<int> ids;
  ids.reserve(results.size());
  for (const auto& r: results) {
    ids.push_back(r.worker_id);
  }
  std::ranges::sort(ids);
  return std::ranges::distance(ids.begin(), std::ranges::unique(ids).begin());
}

static single_vertex_result traverse_from(const graph& g, int start, int worker_id) {
  log_debug("worker {}: start BFS from vertex {}", worker_id, start);
  auto calculation = timed([&] { return bfs_from(g, start); });
  log_debug("worker {}: finish BFS from vertex {} in {}",
            worker_id, start, calculation.elapsed);
  return {start, std::move(calculation.result), calculation.elapsed, worker_id};
}

static std::string describe(std::exception_ptr e) {
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "non-standard exception";
  }
}

namespace detail {
std::expected<std::vector<single_vertex_result>, traversal_error>
collect_results(std::vector<std::future<single_vertex_result>>& futures) {
  std::vector<single_vertex_result> results;
  results.reserve(futures.size());
  std::optional<traversal_error> failure;
  for (size_t v = 0; v < futures.size(); ++v) {
    try {
      results.push_back(futures[v].get());
    } catch (...) {
      if (!failure) {
        failure = traversal_error{
          traversal_errc::task_failure,
          fmt::format("BFS from vertex {} failed: {}", v, describe(std::current_exception()))};
      }
    }
  }
  if (failure) {
    return std::unexpected(std::move(*failure));
  }
  return results;
}
} // namespace detail

std::expected<all_vertices_result, traversal_error>
traverse_from_all_vertices(const graph& g, int worker_count) {
  if (worker_count < 1) {
    return std::unexpected(traversal_error{
      traversal_errc::invalid_worker_count,
      fmt::format("worker count must be at least 1, got {}", worker_count)});
  }

  log_debug("BFS from all {} vertices with {} workers", g.vertex_count(), worker_count);

  const auto vertices = g.vertices();
  if (vertices.empty()) {
    return all_vertices_result{{}, dmilliseconds{0}, worker_count};
  }

  using collected = std::expected<std::vector<single_vertex_result>, traversal_error>;
  auto calculation = timed([&]() -> collected {
    std::optional<worker_pool> pool;
    try {
      pool.emplace(worker_count);
    } catch (const std::exception& e) {
      return std::unexpected(traversal_error{
        traversal_errc::worker_start_failure,
        fmt::format("cannot start {} workers: {}", worker_count, e.what())});
    }
    std::vector<std::future<single_vertex_result>> futures;
    futures.reserve(vertices.size());
    for (int v: vertices) {
      futures.push_back(pool->submit([&g, v](int worker_id) {
        return traverse_from(g, v, worker_id);
      }));
    }
    return detail::collect_results(futures);
  });

  if (!calculation.result) {
    log_debug("BFS from all vertices failed: {}", calculation.result.error().message);
    return std::unexpected(std::move(calculation.result.error()));
  }

  all_vertices_result result{
    std::move(*calculation.result), calculation.elapsed, worker_count};
  log_debug("workers used in current run: {}", result.workers_used());
  log_debug("total time elapsed in current run: {}", result.total_elapsed);
  return result;
}
