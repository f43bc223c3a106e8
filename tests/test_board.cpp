#include "Board.hpp"
#include "Direction.hpp"
#include <cassert>
#include <iostream>

static void test_border_walls_after_construction() {
	Board board(5);
	for (int i = 0; i < 5; ++i) {
		assert(board.isWall(0, i, Directions::Up) && "Top row should be walled above");
		assert(board.isWall(4, i, Directions::Down) && "Bottom row should be walled below");
		assert(board.isWall(i, 0, Directions::Left) && "Left column should be walled on the left");
		assert(board.isWall(i, 4, Directions::Right) && "Right column should be walled on the right");
	}
	assert(board.countWalls() == 4 * 5 && "Only border walls should exist on a fresh board");
	assert(!board.isWall(2, 2, Directions::Up) && "Interior edges start open");
	assert(!board.isWall(0, 0, Directions::Right) && "Corner inner edges start open");
}

static void test_set_wall_mirrors_onto_neighbor() {
	Board board(5);
	board.setWall(2, 2, Directions::Right);
	assert(board.isWall(2, 2, Directions::Right) && "Wall should be set on the cell");
	assert(board.isWall(2, 3, Directions::Left) && "Wall should be mirrored on the right neighbor");
	assert(board.countWalls() == 4 * 5 + 2 && "Exactly two bits should change");

	board.setWall(1, 3, Directions::Up);
	assert(board.isWall(0, 3, Directions::Down) && "Up wall should mirror as a down wall");
	board.setWall(3, 1, Directions::Left);
	assert(board.isWall(3, 0, Directions::Right) && "Left wall should mirror as a right wall");
	board.setWall(3, 1, Directions::Down);
	assert(board.isWall(4, 1, Directions::Up) && "Down wall should mirror as an up wall");
	assert(board.countWalls() == 4 * 5 + 8 && "Each placement adds two bits");
}

static void test_set_wall_is_idempotent() {
	Board once(6);
	once.setWall(1, 4, Directions::Down);
	Board twice(6);
	twice.setWall(1, 4, Directions::Down);
	twice.setWall(1, 4, Directions::Down);
	assert(once == twice && "Setting the same wall twice should match setting it once");

	Board mirrored(6);
	mirrored.setWall(2, 4, Directions::Up);
	assert(once == mirrored && "Setting the mirrored side is the same edge");
}

static void test_border_write_stays_in_bounds() {
	Board board(4);
	Board before = board;
	board.setWall(0, 0, Directions::Up);
	board.setWall(3, 3, Directions::Right);
	assert(board == before && "Border walls already exist and have no neighbor to mirror");
}

static void test_in_bounds_and_walls_record() {
	Board board(4);
	assert(board.inBounds(0, 0) && board.inBounds(3, 3) && "Corners are in bounds");
	assert(!board.inBounds(-1, 0) && !board.inBounds(0, 4) && !board.inBounds(Position(4, 1)) && "Outside cells are not");
	assert(board.getSize() == 4 && "Size should be kept");
	assert(board.wallsAt(0, 0) == ((1u << Directions::Up) | (1u << Directions::Left)) && "Corner record holds two bits");
	board.setWall(1, 1, Directions::Right);
	assert(board.wallsAt(1, 1) == (1u << Directions::Right) && "Interior record holds the placed bit");
}

static void test_copies_are_independent() {
	Board board(5);
	Board copy = board;
	copy.setWall(2, 2, Directions::Down);
	assert(!board.isWall(2, 2, Directions::Down) && "Mutating a copy must not touch the original");
	assert(board != copy && "Boards should differ after the copy changed");
}

int main() {
	test_border_walls_after_construction();
	test_set_wall_mirrors_onto_neighbor();
	test_set_wall_is_idempotent();
	test_border_write_stays_in_bounds();
	test_in_bounds_and_walls_record();
	test_copies_are_independent();
	std::cout << "All board tests passed\n";
	return 0;
}
