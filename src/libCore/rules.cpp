#include "core/rules.hpp"

namespace ttt {

// clang-format off
const std::array<Line, 8u> WINNING_LINES{{
	// Rows
	{{{0u, 0u}, {0u, 1u}, {0u, 2u}}},
	{{{1u, 0u}, {1u, 1u}, {1u, 2u}}},
	{{{2u, 0u}, {2u, 1u}, {2u, 2u}}},
	// Columns
	{{{0u, 0u}, {1u, 0u}, {2u, 0u}}},
	{{{0u, 1u}, {1u, 1u}, {2u, 1u}}},
	{{{0u, 2u}, {1u, 2u}, {2u, 2u}}},
	// Diagonals
	{{{0u, 0u}, {1u, 1u}, {2u, 2u}}},
	{{{0u, 2u}, {1u, 1u}, {2u, 0u}}},
}};
// clang-format on

//! Owner of the line if all three cells hold the same mark.
static std::optional<Mark> lineOwner(const Board& board, const Line& line) {
	const auto first = board.get(line[0]);
	if (first == Board::Cell::Empty) {
		return {};
	}
	for (std::size_t i = 1u; i != line.size(); ++i) {
		if (board.get(line[i]) != first) {
			return {};
		}
	}
	return toMark(first);
}

std::optional<Mark> findWinner(const Board& board) {
	// Alternating play cannot complete lines of both marks, first hit is the winner.
	for (const auto& line: WINNING_LINES) {
		if (const auto owner = lineOwner(board, line)) {
			return owner;
		}
	}
	return {};
}

GameStatus evaluateStatus(const Board& board) {
	if (findWinner(board)) {
		return GameStatus::Won;
	}
	return board.isFull() ? GameStatus::Drawn : GameStatus::Active;
}

} // namespace ttt
