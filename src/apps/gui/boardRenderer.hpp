#pragma once

#include "core/board.hpp"

#include <QPainter>

namespace c4::gui {

class BoardRenderer {
public:
	BoardRenderer() = default;

	unsigned cellSize() const;
	void setCellSizePx(unsigned cellSizePx);

	unsigned widthPx() const;  //!< Pixel width of the whole board.
	unsigned heightPx() const; //!< Pixel height of the whole board.

	void draw(QPainter& painter, const Board& board) const;

	//! Try to convert a pixel position relative to the board origin to a column.
	bool pixelToColumn(int pX, int pY, Id& col) const;

private:
	//! Draw the board background.
	void drawBackground(QPainter& painter) const;
	//! Draw all discs and empty holes given a board.
	void drawDiscs(QPainter& painter, const Board& board) const;
	//! Draw a single disc or hole at a given cell.
	void drawDisc(QPainter& painter, Coord c, const QColor& colour) const;

private:
	unsigned m_cellSize = 0; //!< Pixel edge length of one cell.
};

} // namespace c4::gui
