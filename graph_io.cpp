#include "graph_io.hpp"
#include <charconv>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fstream>
#include <sstream>
#include <vector>

std::string_view to_string(io_errc code) {
  switch (code) {
    case io_errc::invalid_format: return "invalid_format";
    case io_errc::negative_vertex_count: return "negative_vertex_count";
    case io_errc::unreadable_file: return "unreadable_file";
    case io_errc::unwritable_file: return "unwritable_file";
  }
  return "unknown";
}

namespace {
std::unexpected<io_error> invalid_format(std::string message) {
  return std::unexpected(io_error{io_errc::invalid_format, std::move(message)});
}

std::vector<std::string_view> split(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  size_t pos = 0;
  for (;;) {
    size_t next = text.find(sep, pos);
    if (next == std::string_view::npos) {
      parts.push_back(text.substr(pos));
      return parts;
    }
    parts.push_back(text.substr(pos, next - pos));
    pos = next + 1;
  }
}

std::string_view strip_cr(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

bool to_int(std::string_view s, int& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}
} // namespace

std::expected<graph, io_error> parse_graph(std::string_view text) {
  auto lines = split(text, '\n');
  if (lines.size() > 1 && lines.back().empty()) {
    lines.pop_back();
  }

  int n = 0;
  if (!to_int(strip_cr(lines[0]), n) || n < 0) {
    return invalid_format(fmt::format("first line '{}' is not a vertex count", lines[0]));
  }
  if (std::ssize(lines) - 1 != n) {
    return invalid_format(fmt::format(
      "expected {} matrix rows, found {}", n, std::ssize(lines) - 1));
  }

  adjacency_matrix m(n);
  for (int row = 0; row < n; ++row) {
    for (auto token: split(strip_cr(lines[row + 1]), ' ')) {
      if (token.empty()) {
        continue;
      }
      int cell = 0;
      if (!to_int(token, cell) || (cell != 0 && cell != 1)) {
        return invalid_format(fmt::format("row {}: '{}' is not 0 or 1", row, token));
      }
      m[row].push_back(cell);
    }
    if (std::ssize(m[row]) != n) {
      return invalid_format(fmt::format(
        "row {} has {} entries, expected {}", row, m[row].size(), n));
    }
  }

  auto g = graph::from_matrix(std::move(m));
  if (!g) {
    return invalid_format(std::move(g.error().message));
  }
  return std::move(*g);
}

std::string format_graph(const graph& g) {
  std::string out = fmt::format("{}", g.vertex_count());
  for (const auto& row: g.matrix()) {
    out += fmt::format("\n{}", fmt::join(row, " "));
  }
  return out;
}

std::expected<graph, io_error> load_graph(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(io_error{
      io_errc::unreadable_file, fmt::format("cannot open '{}'", path.string())});
  }
  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    return std::unexpected(io_error{
      io_errc::unreadable_file, fmt::format("error reading '{}'", path.string())});
  }

  auto g = parse_graph(content.str());
  if (!g) {
    g.error().message = fmt::format(
      "graph file '{}' has invalid format: {}", path.string(), g.error().message);
  }
  return g;
}

std::expected<void, io_error> write_graph(const graph& g, const std::filesystem::path& path) {
  std::ofstream out(path);
  out << format_graph(g);
  out.close();
  if (!out) {
    return std::unexpected(io_error{
      io_errc::unwritable_file, fmt::format("cannot write '{}'", path.string())});
  }
  return {};
}
