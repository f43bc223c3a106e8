#ifndef GAMECONTROLLER_HPP
#define GAMECONTROLLER_HPP

#include <string>

#include "Game.hpp"

class GameController {
public:
	explicit GameController(Game& game);

	void tick();
	bool isEnded() const;
	const GameState& state() const;
	const MoveHistory& history() const;
	std::string playerName(GameState::PlayerId player) const;

private:
	Game& game;
};

#endif
