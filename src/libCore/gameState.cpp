#include "core/gameState.hpp"

#include <cassert>

namespace c4 {

GameState::GameState() {
	reset();
}

void GameState::reset() {
	board.clear();
	nextFreeRow.fill(ROWS - 1);
	currentPlayer = Player::One;
	movesMade     = 0;
	status        = GameStatus::Active;
	winner        = Winner::None;
}

bool GameState::isOver() const {
	return status != GameStatus::Active;
}

bool GameState::isColumnFull(const Id col) const {
	assert(col >= 0 && col < COLS);

	return nextFreeRow[col] < 0;
}

Coord GameState::dropDisc(const Id col) {
	assert(!isOver());
	assert(!isColumnFull(col));

	const Coord landed{nextFreeRow[col], col};
	board.setAt(landed, toBoardValue(currentPlayer));
	--nextFreeRow[col];
	++movesMade;

	return landed;
}

} // namespace c4
