#pragma once
#include "loa/types.hpp"
#include "loa/move.hpp"
#include "loa/move_list.hpp"

namespace loa {

class Board; // forward

namespace Rules {
  // Pieces of either colour on the full line through SQ along DIR (both
  // ways, edge to edge), SQ itself included.
  int count_line(const Board& b, const Square& sq, int dir);
  // An opposing piece strictly between FROM and TO, or a friendly piece on TO.
  bool blocked(const Board& b, const Square& from, const Square& to);
  bool is_legal(const Board& b, const Square& from, const Square& to);
  // Square-scan order, then direction, then increasing distance.
  void legal_moves(const Board& b, MoveList& out);
}

} // namespace loa
