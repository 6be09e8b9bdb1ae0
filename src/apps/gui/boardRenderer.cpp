#include "boardRenderer.hpp"
#include "uiConfig.hpp"

#include <QPainter>

namespace c4::gui {

unsigned BoardRenderer::cellSize() const {
	return m_cellSize;
}

void BoardRenderer::setCellSizePx(const unsigned cellSizePx) {
	m_cellSize = cellSizePx;
}

unsigned BoardRenderer::widthPx() const {
	return m_cellSize * static_cast<unsigned>(COLS);
}

unsigned BoardRenderer::heightPx() const {
	return m_cellSize * static_cast<unsigned>(ROWS);
}

void BoardRenderer::draw(QPainter& painter, const Board& board) const {
	if (m_cellSize == 0) {
		return;
	}

	drawBackground(painter);
	drawDiscs(painter, board);
}

void BoardRenderer::drawBackground(QPainter& painter) const {
	painter.fillRect(QRect{0, 0, static_cast<int>(widthPx()), static_cast<int>(heightPx())}, COLOR_BOARD);
}

void BoardRenderer::drawDisc(QPainter& painter, const Coord c, const QColor& colour) const {
	const int cell    = static_cast<int>(m_cellSize);
	const int outline = static_cast<int>(DISC_OUTLINE_PX);

	const QRect dest{c.col * cell + outline, c.row * cell + outline, cell - 2 * outline, cell - 2 * outline};

	painter.setBrush(colour);
	painter.drawEllipse(dest);
}

void BoardRenderer::drawDiscs(QPainter& painter, const Board& board) const {
	painter.save();
	painter.setRenderHint(QPainter::Antialiasing, true);
	painter.setPen(Qt::NoPen);

	for (Id row = 0; row != board.rows(); ++row) {
		for (Id col = 0; col != board.cols(); ++col) {
			switch (board.getAt({row, col})) {
			case Board::Value::Empty:
				drawDisc(painter, {row, col}, COLOR_EMPTY);
				break;
			case Board::Value::One:
				drawDisc(painter, {row, col}, COLOR_ONE);
				break;
			case Board::Value::Two:
				drawDisc(painter, {row, col}, COLOR_TWO);
				break;
			}
		}
	}
	painter.restore();
}

bool BoardRenderer::pixelToColumn(const int pX, const int pY, Id& col) const {
	if (m_cellSize == 0) {
		return false;
	}

	// Clicked in bounds
	if (pX < 0 || pY < 0 || pX >= static_cast<int>(widthPx()) || pY >= static_cast<int>(heightPx())) {
		return false;
	}

	col = pX / static_cast<int>(m_cellSize);
	return true;
}

} // namespace c4::gui
