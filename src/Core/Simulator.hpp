#ifndef SIMULATOR_HPP
#define SIMULATOR_HPP

#include <cstdint>
#include <memory>
#include <vector>

#include "Game.hpp"
#include "GameSettings.hpp"
#include "RandomSource.hpp"

// Scores and times are reported in settings order (player1, player2), even
// when the seats were swapped for the game.
struct GameSummary {
	bool ended;
	int player1Score;
	int player2Score;
	int turns;
	std::vector<double> player1Times;
	std::vector<double> player2Times;
	int player1Fallbacks;
	int player2Fallbacks;
};

struct AutoplaySummary {
	int runs;
	int player1Wins;
	int player2Wins;
	int ties;
	double player1MaxTime;
	double player2MaxTime;
	double player1AverageScore;
	double player2AverageScore;
};

class Simulator {
public:
	explicit Simulator(const GameSettings& settings);

	// The game draws from this simulator's random source and must not outlive it.
	std::unique_ptr<Game> createGame(bool swapPlayers);
	GameSummary runGame(bool swapPlayers);
	AutoplaySummary autoplay();

	static GameSummary summarize(const Game& game, bool swapPlayers);

private:
	GameSettings settings;
	Mt19937RandomSource random;

	std::uint32_t nextSeed();
	void logAutoplay(const AutoplaySummary& summary) const;
};

#endif
