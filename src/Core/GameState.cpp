#include "GameState.hpp"

#include "Rules.hpp"

GameState::GameState()
	: board(),
	  posA(),
	  posB(),
	  toMove(PlayerId::A),
	  status(Status::Running),
	  maxStep(0),
	  lastResult(),
	  hasLastMove(false),
	  lastMove(),
	  timesA(),
	  timesB(),
	  lastMessage(),
	  debug(false) {
}

void GameState::reset(int boardSize) {
	board = Board(boardSize);
	posA = Position();
	posB = Position();
	toMove = PlayerId::A;
	status = Status::Running;
	maxStep = Rules::maxStepFor(boardSize);
	lastResult = EndgameResult();
	hasLastMove = false;
	lastMove = Move();
	timesA.clear();
	timesB.clear();
	lastMessage.clear();
}

const Position& GameState::activePosition() const {
	return (toMove == PlayerId::A) ? posA : posB;
}

const Position& GameState::adversaryPosition() const {
	return (toMove == PlayerId::A) ? posB : posA;
}

Position& GameState::positionOf(PlayerId player) {
	return (player == PlayerId::A) ? posA : posB;
}

std::vector<double>& GameState::timesOf(PlayerId player) {
	return (player == PlayerId::A) ? timesA : timesB;
}

GameState::PlayerId GameState::other(PlayerId player) {
	return (player == PlayerId::A) ? PlayerId::B : PlayerId::A;
}

const char* GameState::playerName(PlayerId player) {
	return (player == PlayerId::A) ? "A" : "B";
}
