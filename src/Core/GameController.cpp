#include "GameController.hpp"

GameController::GameController(Game& gameIn) : game(gameIn) {
}

void GameController::tick() {
	if (!game.isEnded()) {
		game.step();
	}
}

bool GameController::isEnded() const {
	return game.isEnded();
}

const GameState& GameController::state() const {
	return game.getState();
}

const MoveHistory& GameController::history() const {
	return game.getHistory();
}

std::string GameController::playerName(GameState::PlayerId player) const {
	return game.getPlayer(player).name();
}
