#include "GameWidget.hpp"

#include "Logging.hpp"

#include <QFont>
#include <QVBoxLayout>
#include <format>

namespace c4::gui {

std::string statusText(const Game& game) {
	switch (game.status()) {
	case GameStatus::Won:
		return std::format("Player {} wins!", static_cast<int>(game.winner()));
	case GameStatus::Draw:
		return "Draw!";
	case GameStatus::Active:
		break;
	}
	return std::format("Player {}'s turn", static_cast<int>(game.currentPlayer()));
}

GameWidget::GameWidget(Game& game, QWidget* parent) : QWidget(parent), m_game{game} {
	buildLayout();

	// Connect slots
	connect(m_newGameButton, &QPushButton::clicked, this, &GameWidget::onNewGameClicked);

	setStatusText();
	m_game.subscribe(this, GS_PlayerChange | GS_StateChange);
}

GameWidget::~GameWidget() {
	m_game.unsubscribe(this);
}

void GameWidget::onGameEvent(const GameSignal signal) {
	switch (signal) {
	case GS_PlayerChange:
	case GS_StateChange:
		setStatusText();
		break;
	default:
		break;
	}
}

void GameWidget::buildLayout() {
	// Layout top to bottom
	auto* mainLayout = new QVBoxLayout(this);
	mainLayout->setContentsMargins(10, 10, 10, 10);
	mainLayout->setSpacing(6);

	// Top: Board
	m_boardWidget = new BoardWidget(m_game, this);
	mainLayout->addWidget(m_boardWidget, 1);

	// Bottom: Status line and button
	m_statusLabel = new QLabel("", this);
	m_statusLabel->setAlignment(Qt::AlignCenter);
	m_statusLabel->setFont(QFont("Helvetica", 14));
	mainLayout->addWidget(m_statusLabel);

	m_newGameButton = new QPushButton("New Game", this);
	m_newGameButton->setFont(QFont("Helvetica", 12));
	mainLayout->addWidget(m_newGameButton, 0, Qt::AlignHCenter);

	setLayout(mainLayout);
}

void GameWidget::setStatusText() {
	m_statusLabel->setText(QString::fromStdString(statusText(m_game)));
}

void GameWidget::onNewGameClicked() {
	Logger().Log(Logging::LogLevel::Info, "New game requested.");
	m_game.reset();
}

} // namespace c4::gui
