#pragma once

#include "boardRenderer.hpp"
#include "core/IGameListener.hpp"
#include "core/game.hpp"

#include <QWidget>

namespace c4::gui {

class BoardWidget : public QWidget, public IGameListener {
	Q_OBJECT

public:
	explicit BoardWidget(Game& game, QWidget* parent = nullptr);
	~BoardWidget() override;

	void onGameEvent(GameSignal signal) override;

protected:
	void resizeEvent(QResizeEvent* event) override;
	void paintEvent(QPaintEvent* event) override;
	void mouseReleaseEvent(QMouseEvent* event) override;

private:
	//! Resolve click position to a column and drop a disc there.
	void handleClick(const QPoint& pos);
	void renderBoard();

	//! Offset to get to the center of the widget for drawing.
	QPoint boardOffset() const;

private:
	Game& m_game;

	BoardRenderer m_boardRenderer;
};

} // namespace c4::gui
