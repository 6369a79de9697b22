#include "loa/regions.hpp"
#include "loa/board.hpp"
#include <algorithm>
#include <functional>

namespace loa {

int Regions::cluster_size(const Board& b, const Square& start, Piece side, Visited& visited) {
  if (side == Piece::Empty || b.get(start) != side || visited[start.index()]) {
    return 0;
  }

  // explicit worklist instead of recursion
  std::vector<Square> stack;
  stack.reserve(NUM_SQUARES);
  visited[start.index()] = true;
  stack.push_back(start);

  int size = 0;
  while (!stack.empty()) {
    Square cur = stack.back();
    stack.pop_back();
    ++size;
    for (const Square& n : cur.adjacent()) {
      if (visited[n.index()] || b.get(n) != side) continue;
      visited[n.index()] = true;
      stack.push_back(n);
    }
  }
  return size;
}

std::vector<int> Regions::region_sizes(const Board& b, Piece side) {
  std::vector<int> sizes;
  Visited visited{};
  for (int i = 0; i < NUM_SQUARES; ++i) {
    int n = cluster_size(b, square_at(i), side, visited);
    if (n > 0) sizes.push_back(n);
  }
  std::sort(sizes.begin(), sizes.end(), std::greater<int>());
  return sizes;
}

} // namespace loa
