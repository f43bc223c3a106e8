#ifndef GAMESETTINGS_HPP
#define GAMESETTINGS_HPP

#include <cstdint>
#include <string>

class GameSettings {
public:
	int boardSize;
	std::string player1;
	std::string player2;
	bool displayUi;
	int displayDelayMs;
	bool debug;
	bool autoplay;
	int autoplayRuns;
	std::uint32_t seed;
	bool verbose;

	GameSettings();

	static bool parseSeed(const std::string& value, std::uint32_t& outSeed);
};

#endif
