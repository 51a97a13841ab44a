#pragma once

#include "core/gameStatus.hpp"
#include "core/types.hpp"

namespace ttt {

//! State change caused by one accepted placement.
struct GameDelta {
	unsigned moveId;   //!< Number of marks on the board after this move.
	Mark mark;         //!< Mark that was placed.
	Coord coord;       //!< Where it was placed.
	Mark nextPlayer;   //!< Mark active after the move.
	GameStatus status; //!< Status after the move.
};

} // namespace ttt
