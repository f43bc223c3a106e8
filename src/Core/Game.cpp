#include "Game.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "Config.hpp"
#include "Direction.hpp"
#include "RandomWalk.hpp"
#include "Rules.hpp"

namespace {
const char* playerTag(GameState::PlayerId player) {
	return (player == GameState::PlayerId::A) ? "\033[34m[PLAYER A]\033[0m" : "\033[31m[PLAYER B]\033[0m";
}

const char* timeColor(double seconds) {
	if (seconds > Config::kSlowTurnSeconds) {
		return "\033[31m";
	}
	if (seconds > Config::kWarnTurnSeconds) {
		return "\033[33m";
	}
	return "\033[32m";
}
}  // namespace

Game::Game(const GameSettings& settingsIn, std::unique_ptr<IPlayer> playerAIn, std::unique_ptr<IPlayer> playerBIn,
	IRandomSource& randomIn)
	: settings(settingsIn),
	  random(randomIn),
	  state(),
	  history(),
	  playerA(std::move(playerAIn)),
	  playerB(std::move(playerBIn)) {
	if (!playerA || !playerB) {
		throw std::invalid_argument("Game requires two players");
	}
	initWorld();
}

const GameState& Game::getState() const {
	return state;
}

const MoveHistory& Game::getHistory() const {
	return history;
}

const IPlayer& Game::getPlayer(GameState::PlayerId player) const {
	return (player == GameState::PlayerId::A) ? *playerA : *playerB;
}

bool Game::isEnded() const {
	return state.status != GameState::Status::Running;
}

bool Game::loadPosition(const Board& board, const Position& posA, const Position& posB, std::string* reason) {
	auto fail = [reason](const std::string& text) {
		if (reason) {
			*reason = text;
		}
		return false;
	};
	if (board.getSize() < 1) {
		return fail("Board is empty");
	}
	if (settings.boardSize != 0 && board.getSize() != settings.boardSize) {
		return fail("Board size " + std::to_string(board.getSize()) + " does not match the configured size "
			+ std::to_string(settings.boardSize));
	}
	if (!board.inBounds(posA) || !board.inBounds(posB)) {
		return fail("Start position is out of boundary");
	}
	if (posA == posB) {
		return fail("Both players start on the same cell");
	}
	EndgameResult result = Connectivity::checkEndgame(board, posA, posB);
	if (result.ended) {
		return fail("Players start in different partitions");
	}
	state.reset(board.getSize());
	state.board = board;
	state.posA = posA;
	state.posB = posB;
	state.lastResult = result;
	state.debug = settings.debug;
	history.clear();
	return true;
}

EndgameResult Game::step() {
	if (isEnded()) {
		return state.lastResult;
	}
	GameState::PlayerId mover = state.toMove;
	IPlayer& player = currentPlayer();
	double elapsedSeconds = 0.0;
	MoveOutcome outcome = requestMove(player, elapsedSeconds);
	if (outcome.kind == MoveOutcome::Kind::FatalAbort) {
		logFailure(mover, outcome.reason);
		throw AbortRequested(outcome.reason);
	}
	state.timesOf(mover).push_back(elapsedSeconds);
	bool fallback = (outcome.kind == MoveOutcome::Kind::InvalidMove);
	Move move = outcome.move;
	if (fallback) {
		logFailure(mover, outcome.reason);
		if (settings.verbose) {
			std::cerr << "Execute Random Walk!" << std::endl;
		}
		move = randomWalk(state.board, state.activePosition(), state.adversaryPosition(), state.maxStep, random);
		state.lastMessage = outcome.reason;
	} else {
		state.lastMessage.clear();
	}

	logMovePlayed(mover, move, elapsedSeconds, fallback);
	applyMove(move);
	history.push(MoveHistory::HistoryEntry{move, mover, elapsedSeconds, fallback, outcome.reason});

	state.toMove = GameState::other(state.toMove);
	EndgameResult result = Connectivity::checkEndgame(state.board, state.posA, state.posB);
	state.lastResult = result;
	updateStatus(result);
	return result;
}

IPlayer& Game::currentPlayer() {
	return (state.toMove == GameState::PlayerId::A) ? *playerA : *playerB;
}

void Game::initWorld() {
	int size = settings.boardSize;
	if (size == 0) {
		size = random.uniformInt(Config::kMinBoardSize, Config::kMaxBoardSize - 1);
	}
	if (size < 2) {
		throw std::invalid_argument("Board size must be at least 2");
	}
	state.reset(size);
	state.debug = settings.debug;
	placeRandomBarriers();
	rollPositions();
	logInit();
}

void Game::placeRandomBarriers() {
	int size = state.board.getSize();
	int barriers = size / 2 - 1;
	for (int i = 0; i < barriers; ++i) {
		Position pos(random.uniformInt(0, size - 1), random.uniformInt(0, size - 1));
		int dir = random.uniformInt(0, Directions::kCount - 1);
		while (state.board.isWall(pos, dir)) {
			pos = Position(random.uniformInt(0, size - 1), random.uniformInt(0, size - 1));
			dir = random.uniformInt(0, Directions::kCount - 1);
		}
		state.board.setWall(pos, dir);
		state.board.setWall(pos.mirrored(size), Directions::opposite(dir));
	}
}

void Game::rollPositions() {
	int size = state.board.getSize();
	// Walls stay fixed; only the start cells are re-drawn.
	for (;;) {
		state.posA = Position(random.uniformInt(0, size - 1), random.uniformInt(0, size - 1));
		state.posB = state.posA.mirrored(size);
		if (state.posA == state.posB) {
			continue;
		}
		state.lastResult = Connectivity::checkEndgame(state.board, state.posA, state.posB);
		if (!state.lastResult.ended) {
			return;
		}
	}
}

MoveOutcome Game::requestMove(IPlayer& player, double& elapsedSeconds) {
	Board snapshot = state.board;
	Position myPos = state.activePosition();
	Position advPos = state.adversaryPosition();
	auto start = std::chrono::steady_clock::now();
	auto elapsed = [start]() {
		return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
	};
	Move move;
	try {
		move = player.step(snapshot, myPos, advPos, state.maxStep);
	} catch (const AbortRequested& e) {
		elapsedSeconds = elapsed();
		if (player.isHuman()) {
			return MoveOutcome::fatal(e.what());
		}
		return MoveOutcome::invalid(std::string("Abort request ignored: ") + e.what());
	} catch (const std::exception& e) {
		elapsedSeconds = elapsed();
		return MoveOutcome::invalid(std::string("An exception raised: ") + e.what());
	} catch (...) {
		elapsedSeconds = elapsed();
		return MoveOutcome::invalid("An unknown exception raised");
	}
	elapsedSeconds = elapsed();

	std::string reason;
	if (!Rules::validateMove(state.board, myPos, advPos, state.maxStep, move, &reason)) {
		return MoveOutcome::invalid(reason);
	}
	return MoveOutcome::valid(move);
}

void Game::applyMove(const Move& move) {
	state.positionOf(state.toMove) = move.destination;
	state.board.setWall(move.destination, move.direction);
	state.lastMove = move;
	state.hasLastMove = true;
}

void Game::updateStatus(const EndgameResult& result) {
	if (!result.ended) {
		return;
	}
	if (result.scoreA > result.scoreB) {
		state.status = GameState::Status::PlayerAWon;
	} else if (result.scoreA < result.scoreB) {
		state.status = GameState::Status::PlayerBWon;
	} else {
		state.status = GameState::Status::Tie;
	}
	logResult(result);
}

void Game::logInit() const {
	if (!settings.verbose) {
		return;
	}
	int size = state.board.getSize();
	std::cout << "\033[90mBoard " << size << "x" << size << ", max steps " << state.maxStep << "\033[0m" << std::endl;
	std::cout << playerTag(GameState::PlayerId::A) << " " << playerA->name() << " starts at " << state.posA << std::endl;
	std::cout << playerTag(GameState::PlayerId::B) << " " << playerB->name() << " starts at " << state.posB << std::endl;
}

void Game::logMovePlayed(GameState::PlayerId player, const Move& move, double elapsedSeconds, bool fallback) const {
	if (!settings.verbose) {
		return;
	}
	std::ostringstream line;
	line << playerTag(player) << " moves to " << move.destination << " facing " << Directions::name(move.direction)
		 << " in " << timeColor(elapsedSeconds) << std::fixed << std::setprecision(4) << elapsedSeconds << "s\033[0m";
	if (fallback) {
		line << " \033[33m(random walk)\033[0m";
	}
	std::cout << line.str() << std::endl;
}

void Game::logFailure(GameState::PlayerId player, const std::string& reason) const {
	if (!settings.verbose) {
		return;
	}
	std::cerr << playerTag(player) << " \033[31m" << reason << "\033[0m" << std::endl;
}

void Game::logResult(const EndgameResult& result) const {
	if (!settings.verbose) {
		return;
	}
	if (result.scoreA == result.scoreB) {
		std::cout << "\033[35mGame ends! It is a Tie!\033[0m" << std::endl;
		return;
	}
	GameState::PlayerId winner = (result.scoreA > result.scoreB) ? GameState::PlayerId::A : GameState::PlayerId::B;
	int blocks = (winner == GameState::PlayerId::A) ? result.scoreA : result.scoreB;
	std::cout << "\033[35mGame ends!\033[0m " << playerTag(winner) << " wins having control over " << blocks
			  << " blocks!" << std::endl;
}
