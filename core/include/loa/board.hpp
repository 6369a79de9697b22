#pragma once
#include "loa/types.hpp"
#include "loa/move.hpp"
#include "loa/move_list.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace loa {

// Contents indexed [row][col]; row 0 is rank 1, so a brace initializer
// lists the bottom row first.
using Layout = std::array<std::array<Piece, BOARD_SIZE>, BOARD_SIZE>;

// Default number of moves per side before the game is tied.
constexpr int DEFAULT_MOVE_LIMIT = 60;

// Largest heuristic magnitude; real wins score kWinningValue in the search.
constexpr Score kHeuristicLimit = 1 << 28;
constexpr Score kHeuristicScale = 46340;

extern const Layout INITIAL_PIECES;

class Board {
public:
  // Standard opening, Black to move.
  Board();
  Board(const Layout& contents, Piece turn);

  void initialize(const Layout& contents, Piece side);
  void clear();

  Piece get(const Square& s) const;
  Piece get(int col, int row) const { return get(Square{col, row}); }
  // Direct write; also passes the move to NEXT when given.
  void set(const Square& s, Piece v, std::optional<Piece> next = std::nullopt);

  Piece turn() const { return turn_; }

  // LIMIT moves per side; throws ConfigError if 2*LIMIT <= moves_made().
  void set_move_limit(int limit);
  int move_limit() const { return move_limit_; }

  bool is_legal(const Square& from, const Square& to) const;
  bool is_legal(const Move& m) const { return is_legal(m.from, m.to); }
  int count_line(const Square& s, int dir) const;
  void legal_moves(MoveList& out) const;

  void make_move(const Move& m);
  void retract();
  void undo();

  int moves_made() const { return static_cast<int>(history_.size()); }
  const std::vector<Move>& history() const { return history_; }

  // Empty for a tie, nullopt while the game is on.
  std::optional<Piece> winner() const;
  bool game_over() const { return winner().has_value(); }

  bool pieces_contiguous(Piece side) const;
  const std::vector<int>& region_sizes(Piece side) const;
  int num_pieces(Piece side) const;

  // Positive favours White. Only meaningful for positions that are not over.
  Score heuristic_estimate() const;

  uint64_t compute_hash() const;

private:
  void invalidate();
  void compute_regions() const;

  std::array<Piece, NUM_SQUARES> cells_;
  Piece turn_ = Piece::Black;
  std::vector<Move> history_;
  int move_limit_ = 2 * DEFAULT_MOVE_LIMIT;

  mutable bool winner_known_ = false;
  mutable std::optional<Piece> winner_;

  mutable bool regions_valid_ = false;
  mutable std::vector<int> white_regions_;
  mutable std::vector<int> black_regions_;
};

bool operator==(const Board& a, const Board& b);
inline bool operator!=(const Board& a, const Board& b) { return !(a == b); }

// Makes a move on construction and retracts it on every exit path.
class ScopedMove {
public:
  ScopedMove(Board& b, const Move& m) : board_(b) { board_.make_move(m); }
  ~ScopedMove() { board_.retract(); }

  ScopedMove(const ScopedMove&) = delete;
  ScopedMove& operator=(const ScopedMove&) = delete;

private:
  Board& board_;
};

} // namespace loa
