#pragma once

#include <cstddef>

namespace ttt {

using Id = unsigned; //!< Board index used by the core library.

constexpr std::size_t BOARD_SIZE = 3u; //!< Rows and columns of the board.

//! Coordinate pair for the board.
//! \note Row first. Both indices are valid in [0, BOARD_SIZE-1].
struct Coord {
	Id row, col;
};

//! Player symbols. X is the canonical starting mark.
enum class Mark { X = 1, O = 2 };

//! Returns the opponent enum value of input mark.
inline constexpr Mark opponent(Mark mark) {
	return mark == Mark::X ? Mark::O : Mark::X;
}

//! True if the coordinate lies on the board.
inline constexpr bool isOnBoard(Coord c) {
	return c.row < BOARD_SIZE && c.col < BOARD_SIZE;
}

} // namespace ttt
