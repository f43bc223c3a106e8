#include "Board.hpp"
#include "Connectivity.hpp"
#include "Direction.hpp"
#include "DisjointSet.hpp"
#include <cassert>
#include <iostream>

static void test_disjoint_set_basics() {
	DisjointSet sets(6);
	assert(sets.setCount() == 6 && "Every element starts alone");
	assert(sets.unite(0, 1) && "First union merges");
	assert(sets.unite(2, 3) && "Second union merges");
	assert(!sets.unite(1, 0) && "Repeated union is a no-op");
	assert(sets.unite(1, 3) && "Joining two sets merges");
	assert(sets.find(0) == sets.find(2) && "Elements share a root after joining");
	assert(sets.find(4) != sets.find(0) && "Untouched element stays apart");
	assert(sets.setCount() == 3 && "Three sets remain");
}

static void test_open_board_is_one_partition() {
	for (int size = 2; size <= 9; ++size) {
		Board board(size);
		EndgameResult result = Connectivity::checkEndgame(board, Position(0, 0), Position(size - 1, size - 1));
		assert(!result.ended && "An open board never ends the game");
		assert(result.scoreA == size * size && result.scoreB == size * size && "Both scores cover the whole board");
		assert(Connectivity::partitionCount(board) == 1 && "Open board is a single partition");
	}
}

static void test_split_board_scores_each_side() {
	Board board(4);
	for (int r = 0; r < 4; ++r) {
		board.setWall(r, 1, Directions::Right);
	}
	EndgameResult result = Connectivity::checkEndgame(board, Position(0, 0), Position(3, 3));
	assert(result.ended && "A full vertical wall separates the players");
	assert(result.scoreA == 8 && result.scoreB == 8 && "Both halves hold eight cells");
	assert(result.scoreA + result.scoreB == 16 && "Two partitions cover the board");
}

static void test_enclosed_corner() {
	Board board(4);
	board.setWall(0, 0, Directions::Right);
	board.setWall(0, 0, Directions::Down);
	EndgameResult result = Connectivity::checkEndgame(board, Position(0, 0), Position(3, 3));
	assert(result.ended && "Enclosed corner is its own partition");
	assert(result.scoreA == 1 && result.scoreB == 15 && "Scores match the partition sizes");

	EndgameResult swapped = Connectivity::checkEndgame(board, Position(3, 3), Position(0, 0));
	assert(swapped.ended && swapped.scoreA == 15 && swapped.scoreB == 1 && "Swapping players swaps the scores");
}

static void test_wall_order_does_not_matter() {
	Board forward(5);
	forward.setWall(1, 0, Directions::Down);
	forward.setWall(1, 1, Directions::Down);
	forward.setWall(1, 2, Directions::Down);
	forward.setWall(1, 3, Directions::Down);
	forward.setWall(1, 4, Directions::Down);
	forward.setWall(3, 3, Directions::Right);

	Board backward(5);
	backward.setWall(3, 4, Directions::Left);
	backward.setWall(2, 4, Directions::Up);
	backward.setWall(2, 3, Directions::Up);
	backward.setWall(2, 2, Directions::Up);
	backward.setWall(2, 1, Directions::Up);
	backward.setWall(2, 0, Directions::Up);

	assert(forward == backward && "Same walls from either side give the same board");
	EndgameResult a = Connectivity::checkEndgame(forward, Position(0, 2), Position(4, 2));
	EndgameResult b = Connectivity::checkEndgame(backward, Position(0, 2), Position(4, 2));
	assert(a == b && "Results should not depend on placement order");
	assert(a.ended && a.scoreA == 10 && a.scoreB == 15 && "Horizontal split gives ten and fifteen cells");
}

static void test_third_partition_not_counted() {
	Board board(5);
	// Pocket around (2,2) that holds neither player.
	board.setWall(2, 2, Directions::Up);
	board.setWall(2, 2, Directions::Right);
	board.setWall(2, 2, Directions::Down);
	board.setWall(2, 2, Directions::Left);
	EndgameResult result = Connectivity::checkEndgame(board, Position(0, 0), Position(4, 4));
	assert(!result.ended && "Players are still connected around the pocket");
	assert(result.scoreA == 24 && result.scoreB == 24 && "Shared partition excludes the pocket");
	assert(Connectivity::partitionCount(board) == 2 && "Pocket is a partition of its own");
}

int main() {
	test_disjoint_set_basics();
	test_open_board_is_one_partition();
	test_split_board_scores_each_side();
	test_enclosed_corner();
	test_wall_order_does_not_matter();
	test_third_partition_not_counted();
	std::cout << "All connectivity tests passed\n";
	return 0;
}
