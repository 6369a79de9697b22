#pragma once
#include "loa/board.hpp"
#include "loa/move.hpp"
#include <cstdint>
#include <limits>
#include <optional>

namespace loa_ai {

/** Larger than any position score. */
constexpr loa::Score kInfinity = std::numeric_limits<loa::Score>::max();
/** Score of a won position (positive for White, negative for Black). */
constexpr loa::Score kWinningValue = kInfinity - 20;

struct SearchResult {
  loa::Score score = 0;
  // only set by the root call
  std::optional<loa::Move> move;
};

/**
 * Fixed-depth minimax with alpha-beta pruning.
 * SENSE is +1 where White's (maximizing) choice is made, -1 for Black.
 */
class AlphaBeta {
public:
  static constexpr int kDefaultDepth = 5;

  AlphaBeta();

  // Best move for the side to move. BOARD is copied, never modified.
  // Returns an invalid Move when the side to move has no legal move.
  // Throws PreconditionError if the game on BOARD is already over.
  loa::Move choose_move(const loa::Board& board);

  /**
   * Search BOARD to DEPTH plies and return its value. The best move is
   * reported only when ROOT is set. BOARD is restored before returning.
   */
  SearchResult search(loa::Board& board, int depth, int sense,
                      loa::Score alpha, loa::Score beta, bool root = false);

  // Throws ConfigError for DEPTH < 1.
  void set_depth(int depth);
  int depth() const { return depth_; }
  // Off: full-width minimax, for checking the pruned search.
  void set_use_pruning(bool use) { use_pruning_ = use; }
  void set_verbose(bool v) { verbose_ = v; }

  struct Stats {
    int64_t nodes_searched;
    int64_t beta_cutoffs;
    int64_t time_ms;
    int depth;
    loa::Score score;

    void reset() {
      nodes_searched = 0;
      beta_cutoffs = 0;
      time_ms = 0;
      depth = 0;
      score = 0;
    }
  };

  const Stats& get_stats() const { return stats_; }

private:
  // Depth for the search from BOARD. Constant for now; a per-phase depth
  // would go here.
  int choose_depth(const loa::Board& board) const;
  static loa::Score terminal_value(loa::Piece winner);

  int depth_;
  bool use_pruning_;
  bool verbose_;
  Stats stats_;
};

} // namespace loa_ai
