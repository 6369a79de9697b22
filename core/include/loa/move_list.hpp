#pragma once
#include "loa/move.hpp"
#include <algorithm>
#include <array>
#include <cstddef>

namespace loa {

// A piece has at most one legal destination per direction (the line count
// fixes the distance), so squares * directions bounds any layout.
constexpr size_t MAX_MOVES = NUM_SQUARES * NUM_DIRECTIONS;

// Generated moves in scan order, stored inline so the search allocates
// nothing per node.
struct MoveList {
  std::array<Move, MAX_MOVES> moves;
  size_t size = 0;

  void clear() { size = 0; }
  void push_back(const Move& m) { moves[size++] = m; }
  bool empty() const { return size == 0; }

  // Compares squares only; generated moves never carry the capture flag.
  bool contains(const Square& from, const Square& to) const {
    return std::any_of(begin(), end(), [&](const Move& m) { return m.from == from && m.to == to; });
  }
  size_t count_from(const Square& from) const {
    return static_cast<size_t>(std::count_if(begin(), end(), [&](const Move& m) { return m.from == from; }));
  }

  Move& operator[](size_t i) { return moves[i]; }
  const Move& operator[](size_t i) const { return moves[i]; }

  Move* begin() { return moves.data(); }
  Move* end() { return moves.data() + size; }
  const Move* begin() const { return moves.data(); }
  const Move* end() const { return moves.data() + size; }
};

} // namespace loa
