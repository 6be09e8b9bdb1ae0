#include "core/board.hpp"

#include <algorithm>
#include <cassert>

namespace c4 {

Board::Board() {
	m_board.fill(Value::Empty);
}

Id Board::rows() const {
	return ROWS;
}

Id Board::cols() const {
	return COLS;
}

void Board::setAt(const Coord c, Value value) {
	assert(value != Board::Value::Empty);
	assert(isInside(c)); // Game checks the column before dropping

	m_board[c.row * COLS + c.col] = value;
}

Board::Value Board::getAt(const Coord c) const {
	assert(isInside(c));

	return m_board[c.row * COLS + c.col];
}

bool Board::isFree(const Coord c) const {
	return getAt(c) == Value::Empty;
}

bool Board::isInside(const Coord c) const {
	return c.row >= 0 && c.row < ROWS && c.col >= 0 && c.col < COLS;
}

std::size_t Board::count() const {
	return static_cast<std::size_t>(std::count_if(m_board.begin(), m_board.end(), [](const Value v) { return v != Value::Empty; }));
}

void Board::clear() {
	m_board.fill(Value::Empty);
}

std::string toString(const Board& board) {
	std::string out;
	out.reserve(static_cast<std::size_t>(board.rows() * (board.cols() + 1)));

	for (Id row = 0; row != board.rows(); ++row) {
		for (Id col = 0; col != board.cols(); ++col) {
			switch (board.getAt({row, col})) {
			case Board::Value::Empty:
				out += '.';
				break;
			case Board::Value::One:
				out += '1';
				break;
			case Board::Value::Two:
				out += '2';
				break;
			}
		}
		out += '\n';
	}
	return out;
}

} // namespace c4
