#include "graph.hpp"
#include "graph_io.hpp"
#include "log.hpp"
#include "random_graph.hpp"
#include "traversal.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <fstream>
#include <string>
#include <vector>

namespace {
constexpr static int vertex_counts[] = { 10, 50, 100, 250, 500 };
constexpr static int worker_counts[] = { 1, 2, 4, 8 };
constexpr static uint64_t seed = 0x5eed'0f'a11'bf5;
constexpr static const char* csv_path = "out.csv";

dmilliseconds mean_task_time(const all_vertices_result& r) {
  if (r.results.empty()) {
    return dmilliseconds{0};
  }
  dmilliseconds sum{0};
  for (const auto& s: r.results) {
    sum += s.elapsed;
  }
  return sum / r.results.size();
}

bool same_traversals(const all_vertices_result& x, const all_vertices_result& y) {
  return std::ranges::equal(x.results, y.results, {},
    &single_vertex_result::traversal, &single_vertex_result::traversal);
}

// Runs the fan-out once per worker count and reports each run. Returns false
// if a run failed.
bool benchmark(const graph& g, std::ofstream& csv) {
  std::vector<all_vertices_result> runs;
  for (int workers: worker_counts) {
    auto result = traverse_from_all_vertices(g, workers);
    if (!result) {
      log_error("{}: {}", to_string(result.error().code), result.error().message);
      return false;
    }
    runs.push_back(std::move(*result));
  }

  auto fastest = std::ranges::min_element(runs, {}, &all_vertices_result::total_elapsed);

  constexpr auto green = fg(fmt::color::green);
  constexpr auto red = fg(fmt::color::red);
  using namespace std::literals;

  for (const auto& run: runs) {
    bool equal = same_traversals(runs.front(), run);
    auto mean = mean_task_time(run);
    fmt::print(
      "{}v\t{} workers ({} used)\ttotal: {}\tmean task: {}\tresult {}\n",
      g.vertex_count(), run.worker_count, run.workers_used(),
      styled(run.total_elapsed, &run == &*fastest ? green : fmt::text_style{}),
      mean,
      equal ? styled("matches"sv, green) : styled("mismatch"sv, red));
    csv << fmt::format("{},{},{},{},{}\n",
      g.vertex_count(), run.worker_count, run.workers_used(),
      run.total_elapsed.count(), mean.count());
    if (!equal) {
      log_warn("traversals with {} workers differ from the single-worker run",
               run.worker_count);
    }
  }
  return true;
}
} // namespace

int main(int argc, char** argv) {
  if (const char* level = std::getenv("ALLBFS_LOG"); level && !set_log_level(level)) {
    log_warn("unknown log level '{}', keeping info", level);
  }

  std::ofstream csv(csv_path);
  csv << "v,workers,used,total_ms,mean_task_ms\n";

  if (argc > 1) {
    auto g = load_graph(argv[1]);
    if (!g) {
      log_error("{}: {}", to_string(g.error().code), g.error().message);
      return EXIT_FAILURE;
    }
    return benchmark(*g, csv) ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  for (int v: vertex_counts) {
    xorshift128 rng(seed);
    timer build_timer;
    auto g = random_graph(rng, v);
    if (!g) {
      log_error("{}: {}", to_string(g.error().code), g.error().message);
      return EXIT_FAILURE;
    }
    log_info("built random graph with {} vertices in {}", v, build_timer.measure());
    if (!benchmark(*g, csv)) {
      return EXIT_FAILURE;
    }
  }
  return EXIT_SUCCESS;
}
