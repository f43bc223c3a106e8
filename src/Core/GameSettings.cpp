#include "GameSettings.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>

#include "Config.hpp"

GameSettings::GameSettings()
	: boardSize(0),
	  player1("random_agent"),
	  player2("random_agent"),
	  displayUi(false),
	  displayDelayMs(Config::kDisplayDelayMs),
	  debug(false),
	  autoplay(false),
	  autoplayRuns(Config::kAutoplayRuns),
	  seed(Config::kDefaultSeed),
	  verbose(true) {
}

bool GameSettings::parseSeed(const std::string& value, std::uint32_t& outSeed) {
	if (value.empty() || value[0] == '-') {
		return false;
	}
	char* end = nullptr;
	errno = 0;
	unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
	if (*end != '\0' || errno == ERANGE || parsed > UINT32_MAX) {
		return false;
	}
	outSeed = static_cast<std::uint32_t>(parsed);
	return true;
}
