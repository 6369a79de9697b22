#include "alphabeta.hpp"
#include "loa/errors.hpp"
#include "loa/move_list.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

using namespace loa_ai;
using namespace loa;

// ============================================================================
// AlphaBeta implementation
// ============================================================================

AlphaBeta::AlphaBeta()
  : depth_(kDefaultDepth), use_pruning_(true), verbose_(false) {
  stats_.reset();
}

void AlphaBeta::set_depth(int depth) {
  if (depth < 1) {
    throw ConfigError("search depth must be at least 1, got " + std::to_string(depth));
  }
  depth_ = depth;
}

int AlphaBeta::choose_depth(const Board& board) const {
  (void)board;
  return depth_;
}

Score AlphaBeta::terminal_value(Piece winner) {
  if (winner == Piece::White) return kWinningValue;
  if (winner == Piece::Black) return -kWinningValue;
  return 0;  // tie
}

/**
 * Minimax body. Both sides share one procedure; SENSE picks max or min.
 * Every move is made under a ScopedMove so the board is back to this
 * node's position on every exit, including a cutoff.
 */
SearchResult AlphaBeta::search(Board& board, int depth, int sense,
                               Score alpha, Score beta, bool root) {
  stats_.nodes_searched++;

  if (auto w = board.winner()) {
    return {terminal_value(*w), std::nullopt};
  }

  if (depth <= 0) {
    return {board.heuristic_estimate(), std::nullopt};
  }

  MoveList moves;
  board.legal_moves(moves);
  if (moves.empty()) {
    // stuck: scored as a loss for the side to move
    return {-sense * kWinningValue, std::nullopt};
  }

  Score best_score = -sense * kInfinity;
  std::optional<Move> best_move;

  for (const Move& move : moves) {
    Score score;
    {
      ScopedMove guard(board, move);
      score = search(board, depth - 1, -sense, alpha, beta).score;
    }

    // strict: the first of equal moves is kept
    if ((sense == 1 && score > best_score) || (sense == -1 && score < best_score)) {
      best_score = score;
      if (root) best_move = move;
    }

    if (sense == 1) {
      alpha = std::max(alpha, score);
    } else {
      beta = std::min(beta, score);
    }

    if (use_pruning_ && alpha >= beta) {
      stats_.beta_cutoffs++;
      break;
    }
  }

  return {best_score, best_move};
}

Move AlphaBeta::choose_move(const Board& board) {
  if (board.game_over()) {
    throw PreconditionError("choose_move on a finished game");
  }
  stats_.reset();

  Board work(board);
  const int depth = choose_depth(work);
  const int sense = (work.turn() == Piece::White) ? 1 : -1;
  stats_.depth = depth;

  if (verbose_) {
    std::cerr << "[AlphaBeta] Starting search (depth=" << depth
              << ", side=" << piece_name(work.turn())
              << ", pruning=" << (use_pruning_ ? "on" : "off") << ")..." << std::endl;
  }

  auto start_time = std::chrono::steady_clock::now();
  SearchResult result = search(work, depth, sense, -kInfinity, kInfinity, true);
  auto end_time = std::chrono::steady_clock::now();
  stats_.time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
  stats_.score = result.score;

  if (!result.move) {
    if (verbose_) {
      std::cerr << "[AlphaBeta] No legal move for " << piece_name(work.turn()) << std::endl;
    }
    return Move();
  }

  if (verbose_) {
    std::cerr << "[AlphaBeta] Search complete | Move: " << to_string(*result.move)
              << " | Value: " << result.score
              << " | Nodes: " << stats_.nodes_searched
              << " | Beta cuts: " << stats_.beta_cutoffs
              << " | Time: " << stats_.time_ms << "ms" << std::endl;
  }
  return *result.move;
}
