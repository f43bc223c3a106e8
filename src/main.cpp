#include "GameController.hpp"
#include "GameSettings.hpp"
#include "IPlayer.hpp"
#include "PlayerRegistry.hpp"
#include "SdlApp.hpp"
#include "Simulator.hpp"
#include "UiLayout.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {
bool parseInt(const std::string& value, int& outValue) {
	if (value.empty()) {
		return false;
	}
	char* end = nullptr;
	long parsed = std::strtol(value.c_str(), &end, 10);
	if (*end != '\0' || parsed < 0 || parsed > 1000000) {
		return false;
	}
	outValue = static_cast<int>(parsed);
	return true;
}

void printUsage(const char* exe) {
	std::cout << "Usage: " << exe << " [--player_1 NAME] [--player_2 NAME] [--board_size N]\n"
	          << "       [--display] [--display_delay MS] [--debug]\n"
	          << "       [--autoplay] [--autoplay_runs N] [--seed S]\n"
	          << "Agents:";
	for (const std::string& name : PlayerRegistry::instance().names()) {
		std::cout << " " << name;
	}
	std::cout << "\n";
}

// Splits "--flag=value" or consumes the next argument.
bool takeValue(int argc, char** argv, int& i, const std::string& flag, std::string& outValue) {
	std::string arg = argv[i];
	if (arg == flag && i + 1 < argc) {
		outValue = argv[++i];
		return true;
	}
	if (arg.rfind(flag + "=", 0) == 0) {
		outValue = arg.substr(flag.size() + 1);
		return true;
	}
	return false;
}

bool parseArgs(int argc, char** argv, GameSettings& settings) {
	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		std::string value;
		if (arg == "--display") {
			settings.displayUi = true;
			continue;
		}
		if (arg == "--debug") {
			settings.debug = true;
			continue;
		}
		if (arg == "--autoplay") {
			settings.autoplay = true;
			continue;
		}
		if (takeValue(argc, argv, i, "--player_1", value)) {
			settings.player1 = value;
			continue;
		}
		if (takeValue(argc, argv, i, "--player_2", value)) {
			settings.player2 = value;
			continue;
		}
		if (takeValue(argc, argv, i, "--board_size", value)) {
			if (!parseInt(value, settings.boardSize)) {
				std::cerr << "Invalid board size: " << value << std::endl;
				return false;
			}
			continue;
		}
		if (takeValue(argc, argv, i, "--display_delay", value)) {
			if (!parseInt(value, settings.displayDelayMs)) {
				std::cerr << "Invalid display delay: " << value << std::endl;
				return false;
			}
			continue;
		}
		if (takeValue(argc, argv, i, "--autoplay_runs", value)) {
			if (!parseInt(value, settings.autoplayRuns)) {
				std::cerr << "Invalid autoplay runs: " << value << std::endl;
				return false;
			}
			continue;
		}
		if (takeValue(argc, argv, i, "--seed", value)) {
			if (!GameSettings::parseSeed(value, settings.seed)) {
				std::cerr << "Invalid seed: " << value << std::endl;
				return false;
			}
			continue;
		}
		std::cerr << "Unknown argument: " << arg << std::endl;
		return false;
	}
	return true;
}

int runSingleGame(Simulator& simulator, const GameSettings& settings) {
	std::unique_ptr<Game> game = simulator.createGame(false);
	if (settings.displayUi) {
		GameController controller(*game);
		UiLayout layout(game->getState().board.getSize());
		SdlApp app(controller, layout, settings.displayDelayMs);
		app.run();
		if (!game->isEnded()) {
			std::cout << "Window closed before the game ended." << std::endl;
			return 0;
		}
	}
	while (!game->isEnded()) {
		game->step();
	}
	GameSummary summary = Simulator::summarize(*game, false);
	std::cout << "Player 1 (" << settings.player1 << "): " << summary.player1Score << " | Player 2 ("
	          << settings.player2 << "): " << summary.player2Score << " after " << summary.turns << " turns" << std::endl;
	if (summary.player1Fallbacks + summary.player2Fallbacks > 0) {
		std::cout << "Random walks: player 1 " << summary.player1Fallbacks << ", player 2 "
		          << summary.player2Fallbacks << std::endl;
	}
	return 0;
}
}  // namespace

int main(int argc, char** argv) {
	GameSettings settings;
	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		if (arg == "--help" || arg == "-h") {
			printUsage(argv[0]);
			return 0;
		}
	}
	if (!parseArgs(argc, argv, settings)) {
		printUsage(argv[0]);
		return 1;
	}
	try {
		Simulator simulator(settings);
		if (settings.autoplay) {
			simulator.autoplay();
			return 0;
		}
		return runSingleGame(simulator, settings);
	} catch (const AbortRequested& e) {
		std::cout << e.what() << std::endl;
		return 0;
	} catch (const std::invalid_argument& e) {
		std::cerr << e.what() << std::endl;
		printUsage(argv[0]);
		return 1;
	}
}
