#pragma once

#include "core/board.hpp"
#include "core/eventHub.hpp"
#include "core/gameStatus.hpp"
#include "core/types.hpp"

#include <optional>

namespace ttt {

//! Outcome of a placement request.
enum class MoveResult {
	Placed,      //!< Cell marked and turn passed to the opponent.
	Occupied,    //!< Cell already holds a mark.
	OutOfBounds, //!< Row or column outside of the board.
	GameOver     //!< Game already won or drawn.
};

//! Core game state: board, active mark and rules.
//! Rejected moves never change the board or the active mark.
class Game {
public:
	//! Setup a game with an empty board and the given mark to move first.
	explicit Game(Mark startingMark = Mark::X);

	// Listeners are bound to this instance.
	Game(const Game&)            = delete;
	Game& operator=(const Game&) = delete;

	//! Active mark places at the coordinate. Toggles the active mark only when Placed.
	MoveResult placeMark(Coord c);

	std::optional<Mark> winner() const; //!< Mark owning a complete line, if any.
	bool isFull() const;                //!< True if every cell is marked.
	GameStatus status() const;          //!< Active, Won or Drawn.

	const Board& board() const; //!< Get board data for rendering.
	Mark currentPlayer() const; //!< Returns the currently active mark.
	unsigned moveCount() const; //!< Number of accepted placements.

public:
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	Board m_board;
	Mark m_currentPlayer;
	unsigned m_moveCount{0u};
	GameStatus m_status{GameStatus::Active};

	EventHub m_eventHub; //!< Hub to signal updates of the game state to external components.
};

} // namespace ttt
