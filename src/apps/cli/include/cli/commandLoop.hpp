#pragma once

#include "core/IGameStateListener.hpp"
#include "core/game.hpp"

#include <iosfwd>
#include <string>

namespace ttt::cli {

//! Drives a game from line based text input.
//! Prints the board after every accepted move and a retry message for every rejected line.
class CommandLoop : public IGameStateListener {
public:
	CommandLoop(Game& game, std::istream& in, std::ostream& out);
	~CommandLoop() override;

	CommandLoop(const CommandLoop&)            = delete;
	CommandLoop& operator=(const CommandLoop&) = delete;

	//! Read turns until the game ends or the input is exhausted. Returns the final status.
	GameStatus run();

	void onGameDelta(const GameDelta& delta) override;

private:
	void handleLine(const std::string& line); //!< Handle a single line of user input.
	void printResult();                        //!< Print the win or draw message.

private:
	Game& m_game;
	std::istream& m_in;
	std::ostream& m_out;
};

} // namespace ttt::cli
