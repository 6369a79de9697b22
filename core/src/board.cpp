#include "loa/board.hpp"
#include "loa/errors.hpp"
#include "loa/regions.hpp"
#include "loa/rules.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace loa {

namespace {
constexpr Piece EMP = Piece::Empty;
constexpr Piece BP = Piece::Black;
constexpr Piece WP = Piece::White;

void require_square(const Square& s) {
  if (!s.valid()) {
    throw PreconditionError("square off the board: (" + std::to_string(s.col) + ","
                            + std::to_string(s.row) + ")");
  }
}

void require_side(Piece p) {
  if (p == Piece::Empty) throw PreconditionError("side to move cannot be Empty");
}
} // namespace

// Black on ranks 1 and 8, White on files a and h, corners empty.
const Layout INITIAL_PIECES = {{
  {{ EMP, BP,  BP,  BP,  BP,  BP,  BP,  EMP }},
  {{ WP,  EMP, EMP, EMP, EMP, EMP, EMP, WP  }},
  {{ WP,  EMP, EMP, EMP, EMP, EMP, EMP, WP  }},
  {{ WP,  EMP, EMP, EMP, EMP, EMP, EMP, WP  }},
  {{ WP,  EMP, EMP, EMP, EMP, EMP, EMP, WP  }},
  {{ WP,  EMP, EMP, EMP, EMP, EMP, EMP, WP  }},
  {{ WP,  EMP, EMP, EMP, EMP, EMP, EMP, WP  }},
  {{ EMP, BP,  BP,  BP,  BP,  BP,  BP,  EMP }}
}};

Board::Board() { clear(); }

Board::Board(const Layout& contents, Piece turn) { initialize(contents, turn); }

void Board::initialize(const Layout& contents, Piece side) {
  require_side(side);
  for (int row = 0; row < BOARD_SIZE; ++row) {
    for (int col = 0; col < BOARD_SIZE; ++col) {
      cells_[Square{col, row}.index()] = contents[row][col];
    }
  }
  turn_ = side;
  move_limit_ = 2 * DEFAULT_MOVE_LIMIT;
  history_.clear();
  invalidate();
}

void Board::clear() { initialize(INITIAL_PIECES, Piece::Black); }

Piece Board::get(const Square& s) const {
  require_square(s);
  return cells_[s.index()];
}

void Board::set(const Square& s, Piece v, std::optional<Piece> next) {
  require_square(s);
  if (next) {
    require_side(*next);
    turn_ = *next;
  }
  cells_[s.index()] = v;
  invalidate();
}

void Board::set_move_limit(int limit) {
  if (limit < 1 || limit > std::numeric_limits<int>::max() / 2) {
    throw ConfigError("move limit out of range: " + std::to_string(limit) + " per side");
  }
  if (2 * limit <= moves_made()) {
    throw ConfigError("move limit too small: " + std::to_string(limit) + " per side with "
                      + std::to_string(moves_made()) + " moves made");
  }
  move_limit_ = 2 * limit;
  winner_known_ = false;
}

bool Board::is_legal(const Square& from, const Square& to) const {
  return Rules::is_legal(*this, from, to);
}

int Board::count_line(const Square& s, int dir) const {
  return Rules::count_line(*this, s, dir);
}

void Board::legal_moves(MoveList& out) const { Rules::legal_moves(*this, out); }

void Board::make_move(const Move& m) {
  if (!is_legal(m)) {
    throw PreconditionError("illegal move " + to_string(m) + " for " + piece_name(turn_));
  }
  Move played = mv(m.from, m.to);
  if (cells_[m.to.index()] == opposite(turn_)) {
    played = played.capture_move();
  }
  cells_[m.to.index()] = cells_[m.from.index()];
  cells_[m.from.index()] = Piece::Empty;
  turn_ = opposite(turn_);
  history_.push_back(played);
  invalidate();
}

void Board::retract() {
  if (history_.empty()) {
    throw PreconditionError("retract with no moves made");
  }
  const Move last = history_.back();
  const Piece moved = cells_[last.to.index()];
  if (moved == Piece::Empty) {
    throw PreconditionError("retract of " + to_string(last) + ": destination is empty");
  }
  history_.pop_back();

  cells_[last.from.index()] = moved;
  cells_[last.to.index()] = last.capture ? opposite(moved) : Piece::Empty;
  turn_ = moved;
  invalidate();
}

void Board::undo() {
  if (moves_made() > 1 && !game_over()) {
    retract();
    retract();
  }
}

std::optional<Piece> Board::winner() const {
  if (!winner_known_) {
    const Piece mover = turn_;
    const Piece other = opposite(mover);
    std::optional<Piece> result;

    // the side that did not just move is credited first
    if (pieces_contiguous(other)) {
      result = other;
    } else if (pieces_contiguous(mover)) {
      result = mover;
    } else {
      const int black = num_pieces(Piece::Black);
      const int white = num_pieces(Piece::White);
      if (black == 0 && white == 0) {
        result = Piece::Empty;
      } else if (black == 0) {
        result = Piece::White;
      } else if (white == 0) {
        result = Piece::Black;
      } else if (moves_made() >= move_limit_) {
        result = Piece::Empty;
      }
    }
    winner_ = result;
    winner_known_ = true;
  }
  return winner_;
}

bool Board::pieces_contiguous(Piece side) const {
  return region_sizes(side).size() == 1;
}

const std::vector<int>& Board::region_sizes(Piece side) const {
  if (side == Piece::Empty) throw PreconditionError("region_sizes() of Empty");
  compute_regions();
  return side == Piece::White ? white_regions_ : black_regions_;
}

int Board::num_pieces(Piece side) const {
  const auto& sizes = region_sizes(side);
  int total = 0;
  for (int n : sizes) total += n;
  return total;
}

Score Board::heuristic_estimate() const {
  const auto& white = region_sizes(Piece::White);
  const auto& black = region_sizes(Piece::Black);
  if (white.empty() || black.empty()) return 0;

  // fewer regions is closer to a win
  const int diff = static_cast<int>(black.size()) - static_cast<int>(white.size());
  if (diff == 0) return 0;

  const double white_ratio = static_cast<double>(white.front()) / num_pieces(Piece::White);
  const double black_ratio = static_cast<double>(black.front()) / num_pieces(Piece::Black);
  const double ratio = diff > 0 ? white_ratio / black_ratio : black_ratio / white_ratio;

  double score = static_cast<double>(kHeuristicScale) * diff * ratio;
  score = std::clamp(score, -static_cast<double>(kHeuristicLimit),
                     static_cast<double>(kHeuristicLimit));
  return static_cast<Score>(std::lround(score));
}

uint64_t Board::compute_hash() const {
  uint64_t seed = 1469598103934665603ULL;
  auto mix = [&](uint64_t v){ seed ^= v; seed *= 1099511628211ULL; };

  for (int i = 0; i < NUM_SQUARES; ++i) {
    mix(static_cast<uint64_t>(cells_[i]));
  }
  mix(static_cast<uint64_t>(turn_));
  return seed;
}

void Board::invalidate() {
  winner_known_ = false;
  regions_valid_ = false;
}

void Board::compute_regions() const {
  if (regions_valid_) return;
  white_regions_ = Regions::region_sizes(*this, Piece::White);
  black_regions_ = Regions::region_sizes(*this, Piece::Black);
  regions_valid_ = true;
}

bool operator==(const Board& a, const Board& b) {
  if (a.turn() != b.turn()) return false;
  for (int i = 0; i < NUM_SQUARES; ++i) {
    if (a.get(square_at(i)) != b.get(square_at(i))) return false;
  }
  return true;
}

} // namespace loa
