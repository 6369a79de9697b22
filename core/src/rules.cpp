#include "loa/rules.hpp"
#include "loa/board.hpp"

namespace loa {

int Rules::count_line(const Board& b, const Square& sq, int dir) {
  int count = 1;
  for (int d : {dir, opposite_direction(dir)}) {
    for (int i = 1; i < BOARD_SIZE; ++i) {
      auto other = sq.move_dest(d, i);
      if (!other) break;
      if (b.get(*other) != Piece::Empty) ++count;
    }
  }
  return count;
}

bool Rules::blocked(const Board& b, const Square& from, const Square& to) {
  const Piece mover = b.get(from);
  if (b.get(to) == mover) return true;
  const int dir = from.direction(to);
  const int dist = from.distance(to);
  for (int i = 1; i < dist; ++i) {
    auto next = from.move_dest(dir, i);
    Piece p = b.get(*next);
    if (p != Piece::Empty && p != mover) return true;
  }
  return false;
}

bool Rules::is_legal(const Board& b, const Square& from, const Square& to) {
  if (!from.is_valid_move(to)) return false;
  if (b.get(from) != b.turn()) return false;
  if (blocked(b, from, to)) return false;
  return count_line(b, from, from.direction(to)) == from.distance(to);
}

void Rules::legal_moves(const Board& b, MoveList& out) {
  out.clear();
  const Piece p = b.turn();

  for (int i = 0; i < NUM_SQUARES; ++i) {
    const Square from = square_at(i);
    if (b.get(from) != p) continue;

    for (int dir = 0; dir < NUM_DIRECTIONS; ++dir) {
      // the line count fixes the only distance worth trying
      const int dist = count_line(b, from, dir);
      auto to = from.move_dest(dir, dist);
      if (!to) continue;
      if (blocked(b, from, *to)) continue;
      out.push_back(mv(from, *to));
    }
  }
}

} // namespace loa
