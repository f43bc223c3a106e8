#include "Connectivity.hpp"
#include "Direction.hpp"
#include "GreedyPlayer.hpp"
#include "HumanPlayer.hpp"
#include "PlayerRegistry.hpp"
#include "RandomPlayer.hpp"
#include "Rules.hpp"
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

static void test_registry_knows_builtin_players() {
	const PlayerRegistry& registry = PlayerRegistry::instance();
	std::vector<std::string> names = registry.names();
	for (const char* name : {"random_agent", "greedy_agent", "human_agent"}) {
		assert(registry.contains(name) && "Built-in player should be registered");
		assert(std::find(names.begin(), names.end(), name) != names.end() && "Built-in player should be listed");
		std::unique_ptr<IPlayer> player = registry.create(name, 1);
		assert(player && player->name() == name && "Factory builds the named player");
	}
	assert(!registry.create("human_agent", 1)->autoplay() && "Humans cannot autoplay");
	assert(registry.create("random_agent", 1)->autoplay() && "Random player can autoplay");
}

static void test_registry_rejects_unknown_name() {
	std::string reason;
	std::unique_ptr<IPlayer> player = PlayerRegistry::instance().create("student_agent", 1, &reason);
	assert(!player && "Unknown name yields no player");
	assert(reason.find("not registered") != std::string::npos && "Reason explains the lookup failure");
	assert(reason.find("random_agent") != std::string::npos && "Reason lists the known players");
}

static void test_custom_registry_entry() {
	PlayerRegistry registry;
	registry.add("lazy_agent", [](std::uint32_t seed) {
		return std::make_unique<RandomPlayer>(seed);
	});
	assert(registry.contains("lazy_agent") && "Added factory is found");
	assert(registry.names().size() == 4 && "Added factory joins the built-in ones");
}

static void test_human_parse_move() {
	Move move;
	assert(HumanPlayer::parseMove("1,2,u", move) && move == Move(Position(1, 2), Directions::Up) && "Comma form");
	assert(HumanPlayer::parseMove("3 0 l", move) && move == Move(Position(3, 0), Directions::Left) && "Space form");
	assert(HumanPlayer::parseMove("0, 4, 1", move) && move == Move(Position(0, 4), Directions::Right) && "Numeric dir");
	assert(!HumanPlayer::parseMove("1,2", move) && "Missing direction");
	assert(!HumanPlayer::parseMove("1,2,x", move) && "Unknown direction");
	assert(!HumanPlayer::parseMove("a,b,u", move) && "Non-numeric cell");
	assert(!HumanPlayer::parseMove("1,2,u,5", move) && "Trailing tokens");
}

static void test_human_reprompts_then_moves() {
	std::istringstream input("nonsense\n2,3,D\n");
	std::ostringstream output;
	HumanPlayer player(input, output);
	Move move = player.step(Board(5), Position(0, 0), Position(4, 4), 3);
	assert(move == Move(Position(2, 3), Directions::Down) && "Second line is the move");
	assert(output.str().find("Wrong input format") != std::string::npos && "Bad line is reported");
}

static void test_human_quit_and_eof_abort() {
	for (const char* text : {"q\n", "QUIT\n", ""}) {
		std::istringstream input(text);
		std::ostringstream output;
		HumanPlayer player(input, output);
		bool aborted = false;
		try {
			player.step(Board(5), Position(0, 0), Position(4, 4), 3);
		} catch (const AbortRequested&) {
			aborted = true;
		}
		assert(aborted && "Quit or closed input aborts");
	}
}

static void test_bots_play_legal_moves() {
	RandomPlayer randomPlayer(17);
	GreedyPlayer greedyPlayer(23);
	for (int game = 0; game < 6; ++game) {
		int size = 6 + game;
		int maxStep = Rules::maxStepFor(size);
		Board board(size);
		Position a(0, 0);
		Position b(size - 1, size - 1);
		for (int turn = 0; turn < 2 * size * size; ++turn) {
			IPlayer& player = (turn % 2 == 0) ? static_cast<IPlayer&>(randomPlayer) : static_cast<IPlayer&>(greedyPlayer);
			Move move = player.step(board, a, b, maxStep);
			assert(Rules::validateMove(board, a, b, maxStep, move) && "Bots only produce legal moves");
			a = move.destination;
			board.setWall(move.destination, move.direction);
			if (Connectivity::checkEndgame(board, a, b).ended) {
				break;
			}
			std::swap(a, b);
		}
	}
}

static void test_greedy_takes_winning_wall() {
	Board board(4);
	for (int r = 0; r < 3; ++r) {
		board.setWall(r, 2, Directions::Right);
	}
	GreedyPlayer player(5);
	Position me(3, 0);
	Position adversary(0, 3);
	Move move = player.step(board, me, adversary, Rules::maxStepFor(4));
	assert(Rules::validateMove(board, me, adversary, 3, move) && "Winning move is legal");
	board.setWall(move.destination, move.direction);
	EndgameResult result = Connectivity::checkEndgame(board, move.destination, adversary);
	assert(result.ended && result.scoreA > result.scoreB && "Greedy closes the gap when it wins");
}

static void test_territory_margin() {
	Board board(5);
	assert(GreedyPlayer::territoryMargin(board, Position(0, 0), Position(4, 4)) == 0 && "Mirrored corners split evenly");
	assert(GreedyPlayer::territoryMargin(board, Position(2, 2), Position(4, 4)) > 0 && "Center owns more cells");
}

int main() {
	test_registry_knows_builtin_players();
	test_registry_rejects_unknown_name();
	test_custom_registry_entry();
	test_human_parse_move();
	test_human_reprompts_then_moves();
	test_human_quit_and_eof_abort();
	test_bots_play_legal_moves();
	test_greedy_takes_winning_wall();
	test_territory_margin();
	std::cout << "All player tests passed\n";
	return 0;
}
