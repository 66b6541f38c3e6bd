#pragma once
#include "graph.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

// Text format, for a graph with 3 vertices:
//   3
//   0 1 0
//   1 0 1
//   0 0 1

enum class io_errc {
  invalid_format,
  negative_vertex_count,
  unreadable_file,
  unwritable_file,
};

std::string_view to_string(io_errc code);

struct io_error {
  io_errc code;
  std::string message;
};

std::expected<graph, io_error> parse_graph(std::string_view text);

// Inverse of parse_graph. No newline after the last row.
std::string format_graph(const graph& g);

std::expected<graph, io_error> load_graph(const std::filesystem::path& path);
std::expected<void, io_error> write_graph(const graph& g, const std::filesystem::path& path);
