#pragma once

#include "core/game.hpp"

#include <QMainWindow>

namespace c4::gui {

class MainWindow : public QMainWindow {
	Q_OBJECT

public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

private:
	Game m_game;

	QWidget* m_gameWidget;
};

} // namespace c4::gui
