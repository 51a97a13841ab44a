#pragma once

#include "core/board.hpp"
#include "core/gameStatus.hpp"

#include <array>
#include <optional>

namespace ttt {

using Line = std::array<Coord, BOARD_SIZE>;

//! All lines that win the game: 3 rows, 3 columns and both diagonals.
extern const std::array<Line, 8u> WINNING_LINES;

//! Returns the mark owning a complete line, or empty if no line is complete.
std::optional<Mark> findWinner(const Board& board);

//! Status of a board when looked at on its own.
GameStatus evaluateStatus(const Board& board);

} // namespace ttt
