#pragma once

#include "core/IGameListener.hpp"
#include "core/board.hpp"
#include "core/eventHub.hpp"
#include "core/gameState.hpp"
#include "core/types.hpp"

namespace c4 {

//! Connect four rules engine. Only writer of the game state.
class Game {
public:
	//! Setup a fresh game. Player One moves first.
	Game();

	//! Start a new game. Can be called at any time.
	void reset();

	//! Drop a disc of the current player into a column.
	//! \param col    Column index in [0, COLS-1].
	//! \param landed Cell the disc landed on. Only written if the move was accepted.
	//! \returns MoveResult::Ok or the reason the move was rejected. Rejected moves do not change the game.
	MoveResult dropPiece(Id col, Coord& landed);

	const Board& board() const;   //!< Get board data for rendering.
	Player currentPlayer() const; //!< Returns the player to move. Unchanged after the winning move.
	GameStatus status() const;    //!< Active, won or drawn.
	Winner winner() const;        //!< Winner of a finished game. Winner::None for draws and active games.
	unsigned movesMade() const;   //!< Discs placed in this game.
	Id nextFreeRow(Id col) const; //!< Row the next disc in col lands on. Negative if full.

	bool isOver() const; //!< Return if the game has finished.
	bool isDraw() const; //!< Return if the game finished without a winner.

public:
	void subscribe(IGameListener* listener, uint64_t signalMask);
	void unsubscribe(IGameListener* listener);

private:
	GameState m_state;
	EventHub m_eventHub; //!< Hub to signal updates of the game state to external components.
};

} // namespace c4
