#include "Board.hpp"

#include <cstddef>

#include "Direction.hpp"

Board::Board() : size(0) {
}

Board::Board(int boardSize) : size(0) {
	reset(boardSize);
}

bool Board::isWall(int row, int col, int dir) const {
	return (cells[index(row, col)] & (1u << dir)) != 0;
}

bool Board::isWall(const Position& pos, int dir) const {
	return isWall(pos.row, pos.col, dir);
}

void Board::setWall(int row, int col, int dir) {
	setBit(row, col, dir);
	int nextRow = row + Directions::rowDelta(dir);
	int nextCol = col + Directions::colDelta(dir);
	// Border edges have no neighbor to mirror onto.
	if (inBounds(nextRow, nextCol)) {
		setBit(nextRow, nextCol, Directions::opposite(dir));
	}
}

void Board::setWall(const Position& pos, int dir) {
	setWall(pos.row, pos.col, dir);
}

std::uint8_t Board::wallsAt(int row, int col) const {
	return cells[index(row, col)];
}

bool Board::inBounds(int row, int col) const {
	return row >= 0 && col >= 0 && row < size && col < size;
}

bool Board::inBounds(const Position& pos) const {
	return inBounds(pos.row, pos.col);
}

int Board::countWalls() const {
	int count = 0;
	for (std::size_t i = 0; i < cells.size(); ++i) {
		for (int dir = 0; dir < Directions::kCount; ++dir) {
			if (cells[i] & (1u << dir)) {
				++count;
			}
		}
	}
	return count;
}

void Board::reset(int boardSize) {
	size = boardSize;
	cells.assign(static_cast<std::size_t>(size * size), 0);
	for (int i = 0; i < size; ++i) {
		setBit(0, i, Directions::Up);
		setBit(i, 0, Directions::Left);
		setBit(size - 1, i, Directions::Down);
		setBit(i, size - 1, Directions::Right);
	}
}

int Board::getSize() const {
	return size;
}

bool Board::operator==(const Board& other) const {
	return size == other.size && cells == other.cells;
}

bool Board::operator!=(const Board& other) const {
	return !(*this == other);
}

int Board::index(int row, int col) const {
	return row * size + col;
}

void Board::setBit(int row, int col, int dir) {
	cells[index(row, col)] = static_cast<std::uint8_t>(cells[index(row, col)] | (1u << dir));
}
