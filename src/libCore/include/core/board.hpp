#pragma once

#include "core/types.hpp"

#include <array>
#include <string>

namespace c4 {

//! Fixed ROWS x COLS grid.
//! \note Row 0 is the top of the board. Discs stack from row ROWS-1 upwards.
class Board {
public:
	//! Possible ownership values of cells on the board.
	enum class Value { Empty = 0, One = static_cast<int>(Player::One), Two = static_cast<int>(Player::Two) };

public:
	Board();

	Id rows() const;
	Id cols() const;

	void setAt(Coord c, Value value); //!< Set at given coordinate (row, col) inside the board.
	Value getAt(Coord c) const;       //!< Get value at given coordinate (row, col) inside the board.
	bool isFree(Coord c) const;       //!< Returns whether a certain board coordinate is free or occupied.
	bool isInside(Coord c) const;     //!< Returns whether the coordinate lies on the board.

	std::size_t count() const; //!< Number of occupied cells.
	void clear();              //!< Remove all discs.

private:
	std::array<Value, ROWS * COLS> m_board{}; //!< Board values, row major.
};

//! Returns the Board::Value enum value of input player.
inline constexpr Board::Value toBoardValue(Player player) {
	return player == Player::Two ? Board::Value::Two : Board::Value::One;
}

//! Text dump of the board. One line per row from top to bottom, '.' for empty cells.
std::string toString(const Board& board);

} // namespace c4
