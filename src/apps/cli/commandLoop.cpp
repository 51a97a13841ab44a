#include "cli/commandLoop.hpp"

#include "core/notation.hpp"

#include "Logging.hpp"

#include <format>
#include <istream>
#include <ostream>

namespace ttt::cli {

static constexpr const char* MSG_INVALID_INPUT =
        "Invalid input! Please enter the coordinates in the format x, y where both x and y are between 0 and 2.";
static constexpr const char* MSG_OUT_OF_RANGE = "Coordinates must be between 0 and 2. Please try again.";
static constexpr const char* MSG_OCCUPIED     = "Invalid move! Spot already taken or out of bounds, please try again.";

CommandLoop::CommandLoop(Game& game, std::istream& in, std::ostream& out) : m_game{game}, m_in{in}, m_out{out} {
	m_game.subscribeState(this);
}

CommandLoop::~CommandLoop() {
	m_game.unsubscribeState(this);
}

GameStatus CommandLoop::run() {
	auto logger = Logger();
	logger.Log(Logging::LogLevel::Info, "[CommandLoop] Session started.");

	m_out << "Starting the game!\n" << renderBoard(m_game.board()) << '\n';

	std::string line;
	while (m_game.status() == GameStatus::Active) {
		m_out << "Player " << toString(m_game.currentPlayer()) << "'s turn. Enter x, y coordinates for your move (0-2, 0-2):\n";
		m_out.flush();

		if (!std::getline(m_in, line)) {
			logger.Log(Logging::LogLevel::Info, "[CommandLoop] Input closed before the game ended.");
			return m_game.status();
		}
		handleLine(line);
	}

	printResult();
	logger.Log(Logging::LogLevel::Info, "[CommandLoop] Session finished.");
	return m_game.status();
}

void CommandLoop::handleLine(const std::string& line) {
	const auto coord = parseCoord(line);
	if (!coord) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[CommandLoop] Could not parse input '{}'.", line));
		m_out << MSG_INVALID_INPUT << '\n';
		return;
	}

	switch (m_game.placeMark(*coord)) {
	case MoveResult::Placed:
		// Board printed by onGameDelta.
		break;
	case MoveResult::OutOfBounds:
		m_out << MSG_OUT_OF_RANGE << '\n';
		break;
	case MoveResult::Occupied:
		m_out << MSG_OCCUPIED << '\n';
		break;
	case MoveResult::GameOver:
		// Loop stops on a finished game before reading more input.
		break;
	}
}

void CommandLoop::printResult() {
	if (const auto winner = m_game.winner()) {
		m_out << "Player " << toString(*winner) << " wins!\n";
	} else if (m_game.isFull()) {
		m_out << "It's a draw!\n";
	}
	m_out.flush();
}

void CommandLoop::onGameDelta(const GameDelta&) {
	m_out << renderBoard(m_game.board()) << '\n';
}

} // namespace ttt::cli
