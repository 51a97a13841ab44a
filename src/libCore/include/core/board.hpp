#pragma once

#include "core/types.hpp"

#include <array>
#include <cassert>
#include <optional>

namespace ttt {

//! The 3x3 tic-tac-toe grid.
//! \note Cells only ever go from Empty to marked. There is no way to clear a cell.
class Board {
public:
	//! Possible values of fields on the board.
	enum class Cell { Empty = 0, X = static_cast<int>(Mark::X), O = static_cast<int>(Mark::O) };

public:
	Board();

	bool place(Coord c, Cell value); //!< Try to mark the given coordinate. False if off board or not free.

	Cell get(Coord c) const;     //!< Get the value at the given coordinate.
	bool isEmpty(Coord c) const; //!< True if the given coordinate is empty.
	bool isFull() const;         //!< True if no cell is empty.
	std::size_t size() const;    //!< Rows/columns of the board.

	bool operator==(const Board& other) const = default;

private:
	std::array<Cell, BOARD_SIZE * BOARD_SIZE> m_cells; //!< Row-major cell data.
};

//! Maps a mark to a cell value.
inline constexpr Board::Cell toCell(const Mark mark) {
	return mark == Mark::O ? Board::Cell::O : Board::Cell::X;
}

//! Maps a cell value back to its mark. Empty for Cell::Empty.
inline constexpr std::optional<Mark> toMark(const Board::Cell cell) {
	switch (cell) {
	case Board::Cell::X:
		return Mark::X;
	case Board::Cell::O:
		return Mark::O;
	case Board::Cell::Empty:
		break;
	}
	return {};
}

} // namespace ttt
