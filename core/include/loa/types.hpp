#pragma once
#include <cstdint>
#include <string>

namespace loa {

enum class Piece : uint8_t { Empty = 0, Black = 1, White = 2 };

using Score = int;

constexpr int BOARD_SIZE = 8;
constexpr int NUM_SQUARES = BOARD_SIZE * BOARD_SIZE;

// White <-> Black. Throws PreconditionError for Empty.
Piece opposite(Piece p);

std::string piece_name(Piece p);
char piece_abbrev(Piece p);

} // namespace loa
