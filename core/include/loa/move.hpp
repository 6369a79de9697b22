#pragma once
#include "loa/square.hpp"
#include <string>

namespace loa {

struct Move {
  Square from;
  Square to;
  // set by Board::make_move when TO held an opposing piece
  bool capture = false;

  bool valid() const { return from.valid() && to.valid(); }

  Move capture_move() const {
    Move m = *this;
    m.capture = true;
    return m;
  }
};

inline Move mv(const Square& from, const Square& to) {
  Move m;
  m.from = from;
  m.to = to;
  return m;
}

inline bool operator==(const Move& a, const Move& b) {
  return a.from == b.from && a.to == b.to && a.capture == b.capture;
}

inline bool operator!=(const Move& a, const Move& b) {
  return !(a == b);
}

// "c4-f4"
std::string to_string(const Move& m);

} // namespace loa
