#include "core/game.hpp"
#include "core/winChecker.hpp"

#include "Logging.hpp"

#include <cassert>
#include <format>

namespace c4 {

Game::Game() = default;

void Game::reset() {
	m_state.reset();

	Logger().Log(Logging::LogLevel::Info, "[Game] New game started.");

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(GS_PlayerChange);
	m_eventHub.signal(GS_StateChange);
}

MoveResult Game::dropPiece(const Id col, Coord& landed) {
	const auto result = checkMove(m_state, col);
	if (result != MoveResult::Ok) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Game] Rejected drop into column {}: {}.", col, toString(result)));
		return result;
	}

	const auto player = m_state.currentPlayer;
	const auto cell   = m_state.dropDisc(col);
	Logger().Log(Logging::LogLevel::Debug, std::format("[Game] Player {} dropped at ({}, {}).", static_cast<int>(player), cell.row, cell.col));

	if (isWinningMove(m_state.board, cell)) {
		m_state.status = GameStatus::Won;
		m_state.winner = toWinner(player);
		Logger().Log(Logging::LogLevel::Info, std::format("[Game] Player {} wins after {} moves.", static_cast<int>(player), m_state.movesMade));
	} else if (m_state.movesMade == static_cast<unsigned>(ROWS * COLS)) {
		m_state.status = GameStatus::Draw;
		m_state.winner = Winner::None;
		Logger().Log(Logging::LogLevel::Info, "[Game] Board full. Draw.");
	} else {
		m_state.currentPlayer = opponent(player);
	}

	assert(m_state.board.count() == m_state.movesMade);
	landed = cell;

	m_eventHub.signal(GS_BoardChange);
	if (m_state.isOver()) {
		m_eventHub.signal(GS_StateChange);
	} else {
		m_eventHub.signal(GS_PlayerChange);
	}
	return MoveResult::Ok;
}

const Board& Game::board() const {
	return m_state.board;
}

Player Game::currentPlayer() const {
	return m_state.currentPlayer;
}

GameStatus Game::status() const {
	return m_state.status;
}

Winner Game::winner() const {
	return m_state.winner;
}

unsigned Game::movesMade() const {
	return m_state.movesMade;
}

Id Game::nextFreeRow(const Id col) const {
	assert(col >= 0 && col < COLS);
	return m_state.nextFreeRow[col];
}

bool Game::isOver() const {
	return m_state.isOver();
}

bool Game::isDraw() const {
	return m_state.status == GameStatus::Draw;
}

void Game::subscribe(IGameListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribe(IGameListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace c4
