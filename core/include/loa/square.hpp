#pragma once
#include "loa/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace loa {

// Directions, clockwise from north.
enum Direction : int { N = 0, NE = 1, E = 2, SE = 3, S = 4, SW = 5, W = 6, NW = 7 };

constexpr int NUM_DIRECTIONS = 8;

inline int opposite_direction(int dir) { return (dir + 4) % NUM_DIRECTIONS; }

struct Square {
  // column a..h -> 0..7, row 1..8 -> 0..7
  int col = -1;
  int row = -1;

  bool valid() const {
    return col >= 0 && col < BOARD_SIZE && row >= 0 && row < BOARD_SIZE;
  }
  int index() const { return row * BOARD_SIZE + col; }

  // Direction index towards TO, or -1 if TO is not on one of the 8 lines.
  int direction(const Square& to) const;
  // Steps between this and TO along a line (king-move distance).
  int distance(const Square& to) const;
  // True iff TO is a different square on one of the 8 lines.
  bool is_valid_move(const Square& to) const;
  // The square STEPS squares away in direction DIR, if on the board.
  std::optional<Square> move_dest(int dir, int steps) const;
  // Up to 8 neighbours, clipped at the edges.
  std::vector<Square> adjacent() const;
};

inline Square sq(int col, int row) { return Square{col, row}; }

inline Square square_at(int index) {
  return Square{index % BOARD_SIZE, index / BOARD_SIZE};
}

inline bool operator==(const Square& a, const Square& b) {
  return a.col == b.col && a.row == b.row;
}

inline bool operator!=(const Square& a, const Square& b) {
  return !(a == b);
}

// "c4"; "--" for an invalid square.
std::string to_string(const Square& s);

} // namespace loa
