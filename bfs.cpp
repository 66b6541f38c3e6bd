#include "graph.hpp"
#include <cassert>
#include <queue>

bfs_traversal bfs_from(const graph& g, int start) {
  assert(g.has_vertex(start));
  bfs_traversal path;
  path.reserve(g.vertex_count());

  std::vector<char> reached(g.vertex_count(), 0);
  std::queue<int> q;
  reached[start] = 1;
  q.push(start);
  do {
    int v = q.front();
    q.pop();
    path.push_back(v);
    // v comes from the queue, so it is always a vertex of g
    const auto ns = g.neighbors(v).value();
    for (int n: ns) {
      if (!reached[n]) {
        reached[n] = 1;
        q.push(n);
      }
    }
  } while (!q.empty());
  return path;
}
