#include "Simulator.hpp"

#include <algorithm>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "Config.hpp"
#include "PlayerRegistry.hpp"

Simulator::Simulator(const GameSettings& settingsIn) : settings(settingsIn), random(settingsIn.seed) {
	const PlayerRegistry& registry = PlayerRegistry::instance();
	for (const std::string& name : {settings.player1, settings.player2}) {
		if (!registry.contains(name)) {
			throw std::invalid_argument("Agent '" + name + "' is not registered.");
		}
	}
	if (settings.boardSize != 0
		&& (settings.boardSize < Config::kMinBoardSize || settings.boardSize > Config::kMaxBoardSize)) {
		throw std::invalid_argument("Board size must be between " + std::to_string(Config::kMinBoardSize) + " and "
			+ std::to_string(Config::kMaxBoardSize));
	}
	if (settings.autoplay) {
		for (const std::string& name : {settings.player1, settings.player2}) {
			std::unique_ptr<IPlayer> candidate = registry.create(name, 0);
			if (!candidate->autoplay()) {
				throw std::invalid_argument("Autoplay mode is not supported by " + name);
			}
		}
		if (settings.autoplayRuns < 1) {
			throw std::invalid_argument("Autoplay needs at least one run");
		}
	}
}

std::unique_ptr<Game> Simulator::createGame(bool swapPlayers) {
	const PlayerRegistry& registry = PlayerRegistry::instance();
	std::string reason;
	std::unique_ptr<IPlayer> first = registry.create(swapPlayers ? settings.player2 : settings.player1, nextSeed(), &reason);
	std::unique_ptr<IPlayer> second = registry.create(swapPlayers ? settings.player1 : settings.player2, nextSeed(), &reason);
	if (!first || !second) {
		throw std::logic_error(reason);
	}
	return std::make_unique<Game>(settings, std::move(first), std::move(second), random);
}

GameSummary Simulator::runGame(bool swapPlayers) {
	std::unique_ptr<Game> game = createGame(swapPlayers);
	while (!game->isEnded()) {
		game->step();
	}
	return summarize(*game, swapPlayers);
}

GameSummary Simulator::summarize(const Game& game, bool swapPlayers) {
	const GameState& state = game.getState();
	GameSummary summary;
	summary.ended = state.lastResult.ended;
	summary.turns = static_cast<int>(game.getHistory().size());
	summary.player1Score = swapPlayers ? state.lastResult.scoreB : state.lastResult.scoreA;
	summary.player2Score = swapPlayers ? state.lastResult.scoreA : state.lastResult.scoreB;
	summary.player1Times = swapPlayers ? state.timesB : state.timesA;
	summary.player2Times = swapPlayers ? state.timesA : state.timesB;
	const MoveHistory& history = game.getHistory();
	summary.player1Fallbacks = history.fallbackCount(swapPlayers ? GameState::PlayerId::B : GameState::PlayerId::A);
	summary.player2Fallbacks = history.fallbackCount(swapPlayers ? GameState::PlayerId::A : GameState::PlayerId::B);
	return summary;
}

AutoplaySummary Simulator::autoplay() {
	settings.verbose = false;
	AutoplaySummary summary = {settings.autoplayRuns, 0, 0, 0, 0.0, 0.0, 0.0, 0.0};
	long long player1Total = 0;
	long long player2Total = 0;
	for (int run = 0; run < settings.autoplayRuns; ++run) {
		GameSummary game = runGame(run % 2 == 1);
		if (game.player1Score > game.player2Score) {
			++summary.player1Wins;
		} else if (game.player1Score < game.player2Score) {
			++summary.player2Wins;
		} else {
			++summary.ties;
		}
		player1Total += game.player1Score;
		player2Total += game.player2Score;
		for (double t : game.player1Times) {
			summary.player1MaxTime = std::max(summary.player1MaxTime, t);
		}
		for (double t : game.player2Times) {
			summary.player2MaxTime = std::max(summary.player2MaxTime, t);
		}
	}
	summary.player1AverageScore = static_cast<double>(player1Total) / summary.runs;
	summary.player2AverageScore = static_cast<double>(player2Total) / summary.runs;
	logAutoplay(summary);
	return summary;
}

std::uint32_t Simulator::nextSeed() {
	return static_cast<std::uint32_t>(random.uniformInt(0, std::numeric_limits<int>::max()));
}

void Simulator::logAutoplay(const AutoplaySummary& summary) const {
	std::cout << std::fixed << std::setprecision(2);
	std::cout << "\033[36mPlayer 1 (" << settings.player1 << ")\033[0m win percentage: "
			  << (100.0 * summary.player1Wins / summary.runs) << "%. Maximum turn time was "
			  << std::setprecision(5) << summary.player1MaxTime << " seconds." << std::endl;
	std::cout << std::setprecision(2) << "\033[36mPlayer 2 (" << settings.player2 << ")\033[0m win percentage: "
			  << (100.0 * summary.player2Wins / summary.runs) << "%. Maximum turn time was "
			  << std::setprecision(5) << summary.player2MaxTime << " seconds." << std::endl;
	std::cout << std::setprecision(2) << "Ties: " << summary.ties << "/" << summary.runs
			  << " | average blocks " << summary.player1AverageScore << " vs " << summary.player2AverageScore << std::endl;
	std::cout.unsetf(std::ios::floatfield);
	std::cout << std::setprecision(6);
}
