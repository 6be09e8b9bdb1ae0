#pragma once

#include "BoardWidget.hpp"
#include "core/IGameListener.hpp"
#include "core/game.hpp"

#include <QLabel>
#include <QPushButton>
#include <QWidget>

#include <string>

namespace c4::gui {

//! Status line for the given game state.
std::string statusText(const Game& game);

class GameWidget : public QWidget, public IGameListener {
	Q_OBJECT

public:
	explicit GameWidget(Game& game, QWidget* parent = nullptr);
	~GameWidget() override;

	void onGameEvent(GameSignal signal) override;

private:
	//! Initial setup constructing the layout of the widget.
	void buildLayout();

	void setStatusText(); //!< Get state from game and update the label.

private: // Slots
	void onNewGameClicked();

private:
	Game& m_game;

	BoardWidget* m_boardWidget   = nullptr;
	QLabel* m_statusLabel        = nullptr; //!< Current player or game result.
	QPushButton* m_newGameButton = nullptr;
};

} // namespace c4::gui
