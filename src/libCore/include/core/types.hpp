#pragma once

#include <cstdint>

namespace c4 {

using Id = int; //!< Board index used by the core library. Column input may be out of range.

constexpr Id ROWS    = 6; //!< Rows of the board. Row 0 is the top row.
constexpr Id COLS    = 7; //!< Columns of the board.
constexpr Id CONNECT = 4; //!< Run length of same-player discs that wins the game.

//! Coordinate pair for the board.
struct Coord {
	Id row, col;

	bool operator==(const Coord&) const = default;
};

enum class Player { One = 1, Two = 2 };

//! Winner of a finished game. None on a finished game means draw.
enum class Winner { None = 0, One = static_cast<int>(Player::One), Two = static_cast<int>(Player::Two) };

enum class GameStatus {
	Active, //!< Moves are accepted.
	Won,    //!< A player connected four.
	Draw    //!< Board full without a winner.
};

//! Outcome of a move attempt.
enum class MoveResult {
	Ok,
	InvalidColumn, //!< Column index outside the board.
	ColumnFull,    //!< No free row left in the column.
	InvalidState   //!< Game is already over.
};

//! Types of notifications.
enum GameSignal : uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< Board was modified.
	GS_PlayerChange = 1 << 1, //!< Active player changed.
	GS_StateChange  = 1 << 2, //!< Game state changed. Reset or finished.
};

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::One ? Player::Two : Player::One;
}

//! Returns the Winner enum value of input player.
inline constexpr Winner toWinner(Player player) {
	return player == Player::One ? Winner::One : Winner::Two;
}

//! Readable name of a move result for logging.
const char* toString(MoveResult result);

} // namespace c4
