#pragma once

#include "core/board.hpp"
#include "core/gameState.hpp"
#include "core/types.hpp"

namespace c4 {

//! Counts contiguous discs equal to the one at c along the line (dRow, dCol), walking both ways.
//! \note Includes the disc at c itself. Returns 0 if c is empty.
Id countConsecutive(const Board& board, Coord c, Id dRow, Id dCol);

//! Returns whether the disc at c is part of a run of at least CONNECT discs.
//! \note Only lines through c are inspected.
bool isWinningMove(const Board& board, Coord c);

//! Rule check of a drop into col without changing the state.
MoveResult checkMove(const GameState& state, Id col);

} // namespace c4
