#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

#include <array>

namespace c4 {

//! The current game state.
struct GameState {
	Board board;                           //!< Current board.
	std::array<Id, COLS> nextFreeRow{};    //!< Row receiving the next disc per column. Negative if full.
	Player currentPlayer{Player::One};     //!< Player to move.
	unsigned movesMade{0};                 //!< Discs placed so far.
	GameStatus status{GameStatus::Active}; //!< Active, won or drawn.
	Winner winner{Winner::None};           //!< Only meaningful if status is not Active.

public:
	GameState();

	//! Back to the start of a game: empty board, all columns open, Player One to move.
	void reset();

	bool isOver() const;
	bool isColumnFull(Id col) const;

	//! Current player drops a disc into the column.
	//! \note Assumes the move is legal. Does not evaluate the outcome or switch players.
	//! \returns Cell the disc landed on.
	Coord dropDisc(Id col);
};

} // namespace c4
