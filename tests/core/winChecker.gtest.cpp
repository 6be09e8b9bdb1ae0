#include "core/winChecker.hpp"

#include <gtest/gtest.h>

namespace c4::gtest {

TEST(WinChecker, CountConsecutive_Single) {
	Board board;
	board.setAt({5, 3}, Board::Value::One);

	EXPECT_EQ(countConsecutive(board, {5, 3}, 0, 1), 1);
	EXPECT_EQ(countConsecutive(board, {5, 3}, 1, 0), 1);
	EXPECT_EQ(countConsecutive(board, {5, 3}, 1, 1), 1);
	EXPECT_EQ(countConsecutive(board, {5, 3}, 1, -1), 1);

	// Empty cell has no run.
	EXPECT_EQ(countConsecutive(board, {0, 0}, 0, 1), 0);
}

// Run is counted on both sides of the inspected disc.
TEST(WinChecker, CountConsecutive_BothWays) {
	Board board;
	board.setAt({5, 1}, Board::Value::Two);
	board.setAt({5, 2}, Board::Value::Two);
	board.setAt({5, 3}, Board::Value::Two);
	board.setAt({5, 4}, Board::Value::One); // Stops the run

	EXPECT_EQ(countConsecutive(board, {5, 1}, 0, 1), 3);
	EXPECT_EQ(countConsecutive(board, {5, 2}, 0, 1), 3);
	EXPECT_EQ(countConsecutive(board, {5, 3}, 0, 1), 3);
	EXPECT_EQ(countConsecutive(board, {5, 4}, 0, 1), 1);
}

TEST(WinChecker, Horizontal) {
	Board board;
	for (Id col = 2; col != 5; ++col) {
		board.setAt({5, col}, Board::Value::One);
	}
	EXPECT_FALSE(isWinningMove(board, {5, 4}));

	// Gap filled in the middle of the run.
	board.setAt({5, 6}, Board::Value::One);
	board.setAt({5, 5}, Board::Value::One);
	EXPECT_TRUE(isWinningMove(board, {5, 5}));
	EXPECT_EQ(countConsecutive(board, {5, 5}, 0, 1), 5);
}

TEST(WinChecker, Vertical) {
	Board board;
	for (Id row = 5; row != 1; --row) {
		board.setAt({row, 0}, Board::Value::Two);
	}
	EXPECT_TRUE(isWinningMove(board, {2, 0}));
	EXPECT_TRUE(isWinningMove(board, {5, 0}));
}

TEST(WinChecker, Diagonals) {
	{
		// Down-right: (2,0) (3,1) (4,2) (5,3)
		Board board;
		for (Id i = 0; i != CONNECT; ++i) {
			board.setAt({2 + i, i}, Board::Value::One);
		}
		EXPECT_TRUE(isWinningMove(board, {2, 0}));
		EXPECT_TRUE(isWinningMove(board, {4, 2}));
	}
	{
		// Down-left: (2,6) (3,5) (4,4) (5,3)
		Board board;
		for (Id i = 0; i != CONNECT; ++i) {
			board.setAt({2 + i, 6 - i}, Board::Value::Two);
		}
		EXPECT_TRUE(isWinningMove(board, {5, 3}));
		EXPECT_TRUE(isWinningMove(board, {3, 5}));
	}
}

// Mixed colours never form a run.
TEST(WinChecker, MixedPlayers) {
	Board board;
	board.setAt({5, 0}, Board::Value::One);
	board.setAt({5, 1}, Board::Value::One);
	board.setAt({5, 2}, Board::Value::Two);
	board.setAt({5, 3}, Board::Value::One);
	EXPECT_FALSE(isWinningMove(board, {5, 3}));
	EXPECT_FALSE(isWinningMove(board, {5, 1}));
}

// Walking stops at the board border.
TEST(WinChecker, BorderRuns) {
	Board board;
	for (Id col = COLS - CONNECT; col != COLS; ++col) {
		board.setAt({0, col}, Board::Value::Two);
	}
	EXPECT_TRUE(isWinningMove(board, {0, COLS - 1}));
	EXPECT_EQ(countConsecutive(board, {0, COLS - 1}, 1, 1), 1);
}

TEST(WinChecker, CheckMove) {
	GameState state;
	EXPECT_EQ(checkMove(state, 0), MoveResult::Ok);
	EXPECT_EQ(checkMove(state, COLS - 1), MoveResult::Ok);
	EXPECT_EQ(checkMove(state, -1), MoveResult::InvalidColumn);
	EXPECT_EQ(checkMove(state, COLS), MoveResult::InvalidColumn);

	for (Id i = 0; i != ROWS; ++i) {
		state.dropDisc(1);
	}
	EXPECT_EQ(checkMove(state, 1), MoveResult::ColumnFull);

	// Game over takes precedence over any column check.
	state.status = GameStatus::Draw;
	EXPECT_EQ(checkMove(state, 0), MoveResult::InvalidState);
	EXPECT_EQ(checkMove(state, -1), MoveResult::InvalidState);
	EXPECT_EQ(checkMove(state, 1), MoveResult::InvalidState);
}

} // namespace c4::gtest
