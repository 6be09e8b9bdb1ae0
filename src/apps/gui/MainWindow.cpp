#include "MainWindow.hpp"

#include "GameWidget.hpp"

namespace c4::gui {

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Connect Four");

	m_gameWidget = new GameWidget(m_game, this);
	setCentralWidget(m_gameWidget);
}

MainWindow::~MainWindow() {
	// Children unsubscribe from the game before it is destroyed.
	delete m_gameWidget;
}

} // namespace c4::gui
