#ifndef GAMESTATE_HPP
#define GAMESTATE_HPP

#include <string>
#include <vector>
#include "Board.hpp"
#include "Connectivity.hpp"
#include "Move.hpp"
#include "Position.hpp"

class GameState {
public:
	enum class PlayerId { A, B };
	enum class Status { Running, PlayerAWon, PlayerBWon, Tie };

	Board board;
	Position posA;
	Position posB;
	PlayerId toMove;
	Status status;
	int maxStep;
	EndgameResult lastResult;
	bool hasLastMove;
	Move lastMove;
	std::vector<double> timesA;
	std::vector<double> timesB;
	std::string lastMessage;
	bool debug;

	GameState();
	void reset(int boardSize);

	const Position& activePosition() const;
	const Position& adversaryPosition() const;
	Position& positionOf(PlayerId player);
	std::vector<double>& timesOf(PlayerId player);

	static PlayerId other(PlayerId player);
	static const char* playerName(PlayerId player);
};

#endif
