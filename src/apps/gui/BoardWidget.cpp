#include "BoardWidget.hpp"

#include "Logging.hpp"
#include "uiConfig.hpp"

#include <QMouseEvent>
#include <QPainter>
#include <QResizeEvent>

#include <algorithm>
#include <format>

namespace c4::gui {

BoardWidget::BoardWidget(Game& game, QWidget* parent) : QWidget(parent), m_game(game) {
	setMouseTracking(false);
	setMinimumSize(static_cast<int>(CELL_SIZE_PX) * COLS, static_cast<int>(CELL_SIZE_PX) * ROWS);
	m_boardRenderer.setCellSizePx(CELL_SIZE_PX);

	m_game.subscribe(this, GS_BoardChange);
}

BoardWidget::~BoardWidget() {
	m_game.unsubscribe(this);
}

void BoardWidget::resizeEvent(QResizeEvent* event) {
	QWidget::resizeEvent(event);

	const auto cellSize = std::min(width() / COLS, height() / ROWS);
	m_boardRenderer.setCellSizePx(static_cast<unsigned>(std::max(cellSize, 0)));

	update();
}

void BoardWidget::mouseReleaseEvent(QMouseEvent* event) {
#ifndef NDEBUG
	Logger().Log(Logging::LogLevel::Info, std::format("Mouse click at: ({}, {})", event->pos().x(), event->pos().y()));
#endif

	if (event->button() == Qt::LeftButton) {
		handleClick(event->pos());
		event->accept();
		return;
	}

	QWidget::mouseReleaseEvent(event);
}

void BoardWidget::onGameEvent(const GameSignal signal) {
	switch (signal) {
	case GS_BoardChange:
		update();
		break;
	default:
		break;
	}
}

void BoardWidget::handleClick(const QPoint& pos) {
	const auto local = pos - boardOffset();

	Id col{};
	if (!m_boardRenderer.pixelToColumn(local.x(), local.y(), col)) {
		return;
	}

	// Rejected moves leave the board as is.
	Coord landed{};
	const auto result = m_game.dropPiece(col, landed);
	if (result != MoveResult::Ok) {
		Logger().Log(Logging::LogLevel::Debug, std::format("Ignored click on column {}: {}", col, toString(result)));
	}
}

void BoardWidget::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);
	renderBoard();
}

void BoardWidget::renderBoard() {
	QPainter painter(this);
	painter.save();
	painter.translate(boardOffset()); // Center in drawing area
	m_boardRenderer.draw(painter, m_game.board());
	painter.restore();
}

QPoint BoardWidget::boardOffset() const {
	const int dx = (width() - static_cast<int>(m_boardRenderer.widthPx())) / 2;
	const int dy = (height() - static_cast<int>(m_boardRenderer.heightPx())) / 2;
	return {dx, dy};
}

} // namespace c4::gui
