#pragma once

#include "core/board.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ttt {

//! Parse a mark designator ("X" or "O", case insensitive). Empty on anything else.
std::optional<Mark> markFromString(std::string_view s);

//! Parse a designator and fall back to Mark::X when it is not recognized.
//! \note Permissive on purpose: a bad starting player selection never stops a session. The fallback is logged.
Mark markOrDefault(std::string_view s);

std::string toString(Mark mark); //!< "X" or "O".
char toChar(Board::Cell cell);   //!< 'X', 'O' or ' '.

//! Parse "row, col" user input. Whitespace around each number is ignored.
//! \note Only checks the format. Range checks are done by the game.
std::optional<Coord> parseCoord(std::string_view s);

//! Three lines "a | b | c", one per row. Each line ends with '\n'.
std::string renderBoard(const Board& board);

} // namespace ttt
