#include "loa/types.hpp"
#include "loa/errors.hpp"

namespace loa {

Piece opposite(Piece p) {
  switch (p) {
    case Piece::Black: return Piece::White;
    case Piece::White: return Piece::Black;
    default: break;
  }
  throw PreconditionError("opposite() of an empty square");
}

std::string piece_name(Piece p) {
  if (p == Piece::Black) return "Black";
  if (p == Piece::White) return "White";
  return "Empty";
}

char piece_abbrev(Piece p) {
  if (p == Piece::Black) return 'b';
  if (p == Piece::White) return 'w';
  return '-';
}

} // namespace loa
