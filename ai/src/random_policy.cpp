#include "random_policy.hpp"
#include "loa/move_list.hpp"
#include <chrono>

namespace loa_ai {

RandomPolicy::RandomPolicy()
  : rng_(std::chrono::steady_clock::now().time_since_epoch().count()) {
}

RandomPolicy::RandomPolicy(unsigned seed) : rng_(seed) {}

loa::Move RandomPolicy::pick(const loa::Board& b) {
  loa::MoveList moves;
  b.legal_moves(moves);
  if (moves.empty()) {
    return loa::Move(); // No legal move
  }

  std::uniform_int_distribution<size_t> dist(0, moves.size - 1);
  return moves[dist(rng_)];
}

} // namespace loa_ai
