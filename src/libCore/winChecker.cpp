#include "core/winChecker.hpp"

#include <array>

namespace c4 {

namespace {

struct Direction {
	Id dRow, dCol;
};

//! Horizontal, vertical and both diagonals.
constexpr std::array<Direction, 4> DIRECTIONS{{{0, 1}, {1, 0}, {1, 1}, {1, -1}}};

Id walk(const Board& board, const Coord start, const Id dRow, const Id dCol, const Board::Value value) {
	Id count = 0;
	Coord c{start.row + dRow, start.col + dCol};
	while (board.isInside(c) && board.getAt(c) == value) {
		++count;
		c.row += dRow;
		c.col += dCol;
	}
	return count;
}

} // namespace

Id countConsecutive(const Board& board, const Coord c, const Id dRow, const Id dCol) {
	const auto value = board.getAt(c);
	if (value == Board::Value::Empty) {
		return 0;
	}

	return 1 + walk(board, c, dRow, dCol, value) + walk(board, c, -dRow, -dCol, value);
}

bool isWinningMove(const Board& board, const Coord c) {
	for (const auto& [dRow, dCol]: DIRECTIONS) {
		if (countConsecutive(board, c, dRow, dCol) >= CONNECT) {
			return true;
		}
	}
	return false;
}

MoveResult checkMove(const GameState& state, const Id col) {
	if (state.isOver()) {
		return MoveResult::InvalidState;
	}
	if (col < 0 || col >= COLS) {
		return MoveResult::InvalidColumn;
	}
	if (state.isColumnFull(col)) {
		return MoveResult::ColumnFull;
	}
	return MoveResult::Ok;
}

} // namespace c4
