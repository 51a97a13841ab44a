#include "core/game.hpp"
#include "core/notation.hpp"
#include "core/rules.hpp"

#include "Logging.hpp"

#include <format>

namespace ttt {

Game::Game(const Mark startingMark) : m_currentPlayer{startingMark} {
	Logger().Log(Logging::LogLevel::Info, std::format("[Game] New game. {} starts.", toString(startingMark)));
}

MoveResult Game::placeMark(const Coord c) {
	auto logger = Logger();

	if (m_status != GameStatus::Active) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Rejected move ({}, {}): game is over.", c.row, c.col));
		return MoveResult::GameOver;
	}
	if (!isOnBoard(c)) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Rejected move ({}, {}): outside of the board.", c.row, c.col));
		return MoveResult::OutOfBounds;
	}
	if (!m_board.place(c, toCell(m_currentPlayer))) {
		logger.Log(Logging::LogLevel::Warning, std::format("[Game] Rejected move ({}, {}): cell occupied.", c.row, c.col));
		return MoveResult::Occupied;
	}

	const auto placed = m_currentPlayer;
	m_currentPlayer   = opponent(m_currentPlayer);
	m_status          = evaluateStatus(m_board);
	++m_moveCount;

	logger.Log(Logging::LogLevel::Debug, std::format("[Game] {} placed at ({}, {}).", toString(placed), c.row, c.col));
	if (m_status == GameStatus::Won) {
		logger.Log(Logging::LogLevel::Info, std::format("[Game] {} won after {} moves.", toString(placed), m_moveCount));
	} else if (m_status == GameStatus::Drawn) {
		logger.Log(Logging::LogLevel::Info, "[Game] Game drawn.");
	}

	m_eventHub.signalDelta(GameDelta{
	        .moveId     = m_moveCount,
	        .mark       = placed,
	        .coord      = c,
	        .nextPlayer = m_currentPlayer,
	        .status     = m_status,
	});
	return MoveResult::Placed;
}

std::optional<Mark> Game::winner() const {
	return findWinner(m_board);
}

bool Game::isFull() const {
	return m_board.isFull();
}

GameStatus Game::status() const {
	return m_status;
}

const Board& Game::board() const {
	return m_board;
}

Mark Game::currentPlayer() const {
	return m_currentPlayer;
}

unsigned Game::moveCount() const {
	return m_moveCount;
}

void Game::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace ttt
