#ifndef GAME_HPP
#define GAME_HPP

#include <memory>
#include <string>

#include "Connectivity.hpp"
#include "GameSettings.hpp"
#include "GameState.hpp"
#include "IPlayer.hpp"
#include "MoveHistory.hpp"
#include "MoveOutcome.hpp"
#include "RandomSource.hpp"

class Game {
public:
	Game(const GameSettings& settings, std::unique_ptr<IPlayer> playerA, std::unique_ptr<IPlayer> playerB,
		IRandomSource& random);

	const GameState& getState() const;
	const MoveHistory& getHistory() const;
	const IPlayer& getPlayer(GameState::PlayerId player) const;
	bool isEnded() const;
	bool loadPosition(const Board& board, const Position& posA, const Position& posB, std::string* reason = nullptr);
	EndgameResult step();

private:
	GameSettings settings;
	IRandomSource& random;
	GameState state;
	MoveHistory history;
	std::unique_ptr<IPlayer> playerA;
	std::unique_ptr<IPlayer> playerB;

	IPlayer& currentPlayer();
	void initWorld();
	void placeRandomBarriers();
	void rollPositions();
	MoveOutcome requestMove(IPlayer& player, double& elapsedSeconds);
	void applyMove(const Move& move);
	void updateStatus(const EndgameResult& result);
	void logInit() const;
	void logMovePlayed(GameState::PlayerId player, const Move& move, double elapsedSeconds, bool fallback) const;
	void logFailure(GameState::PlayerId player, const std::string& reason) const;
	void logResult(const EndgameResult& result) const;
};

#endif
