#pragma once

namespace ttt {

enum class GameStatus {
	Active, //!< Game being played.
	Won,    //!< A line of three was completed.
	Drawn   //!< Board full without a winner.
};

} // namespace ttt
