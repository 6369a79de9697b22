#include <iostream>
#include <cstdlib>
#include "alphabeta.hpp"
#include "loa/board.hpp"
#include "loa/errors.hpp"

// usage: measure_search [depth]
int main(int argc, char** argv) {
  using namespace loa_ai;
  using namespace loa;

  int depth = 3;
  if (argc > 1) depth = std::atoi(argv[1]);

  Board board;

  AlphaBeta pruned;
  AlphaBeta full;
  try {
    pruned.set_depth(depth);
    full.set_depth(depth);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  full.set_use_pruning(false);

  Move pruned_move = pruned.choose_move(board);
  Move full_move = full.choose_move(board);
  const auto& ps = pruned.get_stats();
  const auto& fs = full.get_stats();

  std::cout << "Depth: " << depth << std::endl;
  std::cout << "Alpha-beta:  move " << to_string(pruned_move) << ", value " << ps.score
            << ", nodes " << ps.nodes_searched << ", beta cutoffs " << ps.beta_cutoffs
            << ", " << ps.time_ms << "ms" << std::endl;
  std::cout << "Exhaustive:  move " << to_string(full_move) << ", value " << fs.score
            << ", nodes " << fs.nodes_searched << ", " << fs.time_ms << "ms" << std::endl;

  if (pruned_move != full_move || ps.score != fs.score) {
    std::cout << "MISMATCH between pruned and exhaustive search" << std::endl;
    return 1;
  }
  return 0;
}
