#include "loa/square.hpp"
#include <cstdlib>
#include <algorithm>

namespace loa {

// {dcol, drow} for N, NE, E, SE, S, SW, W, NW
static constexpr int DIR[NUM_DIRECTIONS][2] = {
  {0,1},{1,1},{1,0},{1,-1},{0,-1},{-1,-1},{-1,0},{-1,1}
};

static int sign(int v) { return (v > 0) - (v < 0); }

int Square::direction(const Square& to) const {
  const int dc = to.col - col;
  const int dr = to.row - row;
  if (dc == 0 && dr == 0) return -1;
  if (dc != 0 && dr != 0 && std::abs(dc) != std::abs(dr)) return -1;
  for (int d = 0; d < NUM_DIRECTIONS; ++d) {
    if (DIR[d][0] == sign(dc) && DIR[d][1] == sign(dr)) return d;
  }
  return -1;
}

int Square::distance(const Square& to) const {
  return std::max(std::abs(to.col - col), std::abs(to.row - row));
}

bool Square::is_valid_move(const Square& to) const {
  return valid() && to.valid() && direction(to) >= 0;
}

std::optional<Square> Square::move_dest(int dir, int steps) const {
  if (dir < 0 || dir >= NUM_DIRECTIONS) return std::nullopt;
  Square s{col + DIR[dir][0] * steps, row + DIR[dir][1] * steps};
  if (!s.valid()) return std::nullopt;
  return s;
}

std::vector<Square> Square::adjacent() const {
  std::vector<Square> out;
  out.reserve(NUM_DIRECTIONS);
  for (int d = 0; d < NUM_DIRECTIONS; ++d) {
    if (auto s = move_dest(d, 1)) out.push_back(*s);
  }
  return out;
}

std::string to_string(const Square& s) {
  if (!s.valid()) return "--";
  std::string out;
  out += static_cast<char>('a' + s.col);
  out += static_cast<char>('1' + s.row);
  return out;
}

} // namespace loa
