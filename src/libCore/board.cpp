#include "core/board.hpp"

namespace ttt {

static std::size_t toIndex(const Coord c) {
	assert(isOnBoard(c));
	return c.row * BOARD_SIZE + c.col;
}

Board::Board() {
	m_cells.fill(Cell::Empty);
}

std::size_t Board::size() const {
	return BOARD_SIZE;
}

bool Board::place(const Coord c, const Cell value) {
	assert(value != Cell::Empty); // Cells never get cleared.

	if (!isOnBoard(c) || !isEmpty(c)) {
		return false;
	}
	m_cells[toIndex(c)] = value;
	return true;
}

Board::Cell Board::get(const Coord c) const {
	return m_cells[toIndex(c)];
}

bool Board::isEmpty(const Coord c) const {
	return get(c) == Cell::Empty;
}

bool Board::isFull() const {
	for (const auto cell: m_cells) {
		if (cell == Cell::Empty) {
			return false;
		}
	}
	return true;
}

} // namespace ttt
