#pragma once
#include "loa/board.hpp"
#include "loa/move.hpp"
#include <random>

namespace loa_ai {

class RandomPolicy {
public:
  RandomPolicy();
  explicit RandomPolicy(unsigned seed);
  // Invalid Move when there is no legal move.
  loa::Move pick(const loa::Board& b);

private:
  std::mt19937 rng_;
};

} // namespace loa_ai
