#include "Board.hpp"
#include "Direction.hpp"
#include "Rules.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {
const Position kNoAdversary(-1, -1);

int firstOpenDirection(const Board& board, const Position& pos) {
	for (int dir = 0; dir < Directions::kCount; ++dir) {
		if (!board.isWall(pos, dir)) {
			return dir;
		}
	}
	return -1;
}
}

static void test_max_step_budget() {
	assert(Rules::maxStepFor(4) == 3 && "Budget for 4 is ceil(5/2)");
	assert(Rules::maxStepFor(5) == 3 && "Budget for 5 is ceil(6/2)");
	assert(Rules::maxStepFor(6) == 4 && "Budget for 6 is ceil(7/2)");
	assert(Rules::maxStepFor(11) == 6 && "Budget for 11 is ceil(12/2)");
}

static void test_open_board_matches_manhattan_distance() {
	Board board(7);
	Position start(3, 3);
	int maxStep = Rules::maxStepFor(7);
	for (int r = 0; r < 7; ++r) {
		for (int c = 0; c < 7; ++c) {
			Position end(r, c);
			int dir = firstOpenDirection(board, end);
			bool expected = std::abs(r - 3) + std::abs(c - 3) <= maxStep;
			bool valid = Rules::checkValidStep(board, start, end, dir, kNoAdversary, maxStep);
			assert(valid == expected && "Open board reachability should follow Manhattan distance");
		}
	}
}

static void test_existing_wall_rejects_destination() {
	Board board(5);
	board.setWall(1, 1, Directions::Right);
	assert(!Rules::checkValidStep(board, Position(1, 1), Position(1, 1), Directions::Right, Position(4, 4), 3)
		&& "Staying put cannot reuse an existing wall");
	assert(!Rules::checkValidStep(board, Position(1, 0), Position(1, 1), Directions::Right, Position(4, 4), 3)
		&& "Reachable destination is still rejected when the wall exists");
	assert(!Rules::checkValidStep(board, Position(1, 0), Position(0, 0), Directions::Up, Position(4, 4), 3)
		&& "Border edges count as existing walls");
	assert(Rules::checkValidStep(board, Position(1, 1), Position(1, 1), Directions::Down, Position(4, 4), 3)
		&& "Staying put with a free wall is always legal");
}

static void test_adversary_blocks_path() {
	Board board(5);
	Position adversary(0, 1);
	assert(!Rules::checkValidStep(board, Position(0, 0), Position(0, 2), Directions::Down, adversary, 3)
		&& "Detour around the adversary needs four steps");
	assert(Rules::checkValidStep(board, Position(0, 0), Position(0, 2), Directions::Down, adversary, 4)
		&& "Detour fits a budget of four");
	assert(!Rules::checkValidStep(board, Position(0, 0), adversary, Directions::Down, adversary, 3)
		&& "Landing on the adversary is never legal");
}

static void test_walls_block_path() {
	Board board(5);
	board.setWall(0, 0, Directions::Right);
	board.setWall(0, 0, Directions::Down);
	assert(!Rules::checkValidStep(board, Position(0, 0), Position(0, 1), Directions::Down, kNoAdversary, 3)
		&& "Walled-in cell cannot leave");
	assert(Rules::checkValidStep(board, Position(0, 1), Position(1, 0), Directions::Down, kNoAdversary, 2)
		&& "Path around the walls takes two steps");
	assert(!Rules::checkValidStep(board, Position(0, 1), Position(1, 0), Directions::Down, kNoAdversary, 1)
		&& "One step is not enough to go around");
}

static void test_validate_move_reports_reason() {
	Board board(5);
	std::string reason;
	assert(!Rules::validateMove(board, Position(0, 0), Position(4, 4), 3, Move(Position(5, 0), Directions::Up), &reason)
		&& "Out of bounds destination is invalid");
	assert(reason.find("out of boundary") != std::string::npos && "Reason should mention the boundary");

	assert(!Rules::validateMove(board, Position(0, 0), Position(4, 4), 3, Move(Position(0, 1), 4), &reason)
		&& "Direction outside [0, 3] is invalid");
	assert(reason.find("[0, 3]") != std::string::npos && "Reason should mention the direction range");

	assert(!Rules::validateMove(board, Position(0, 0), Position(4, 4), 3, Move(Position(3, 3), Directions::Up), &reason)
		&& "Too far destination is invalid");
	assert(reason.find("Not a valid step") != std::string::npos && "Reason should mention the step");

	assert(Rules::validateMove(board, Position(0, 0), Position(4, 4), 3, Move(Position(1, 2), Directions::Up))
		&& "Reachable destination with a free wall is valid");
}

static void test_reachable_cells_on_open_board() {
	Board board(5);
	std::vector<Position> cells = Rules::reachableCells(board, Position(2, 2), kNoAdversary, 3);
	assert(cells.size() == 21 && "Every cell but the four corners is within three steps of the center");
	assert(cells.front() == Position(2, 2) && "Start cell is reachable");

	std::vector<Position> blocked = Rules::reachableCells(board, Position(0, 0), Position(0, 1), 1);
	assert(blocked.size() == 2 && "Adversary leaves only the start and the cell below");
}

int main() {
	test_max_step_budget();
	test_open_board_matches_manhattan_distance();
	test_existing_wall_rejects_destination();
	test_adversary_blocks_path();
	test_walls_block_path();
	test_validate_move_reports_reason();
	test_reachable_cells_on_open_board();
	std::cout << "All rules tests passed\n";
	return 0;
}
