#pragma once
#include "loa/types.hpp"
#include "loa/square.hpp"
#include <array>
#include <vector>

namespace loa {

class Board; // forward

namespace Regions {
  using Visited = std::array<bool, NUM_SQUARES>;

  // Size of the not yet visited cluster of SIDE pieces containing START,
  // 8-neighbour connectivity. Marks the cluster in VISITED.
  int cluster_size(const Board& b, const Square& start, Piece side, Visited& visited);

  // Sizes of all SIDE clusters, largest first. Empty when SIDE has no pieces.
  std::vector<int> region_sizes(const Board& b, Piece side);
}

} // namespace loa
