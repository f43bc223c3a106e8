#ifndef BOARD_HPP
#define BOARD_HPP

#include <cstdint>
#include <vector>

#include "Position.hpp"

class Board {
public:
	Board();
	explicit Board(int boardSize);

	bool isWall(int row, int col, int dir) const;
	bool isWall(const Position& pos, int dir) const;
	void setWall(int row, int col, int dir);
	void setWall(const Position& pos, int dir);
	std::uint8_t wallsAt(int row, int col) const;
	bool inBounds(int row, int col) const;
	bool inBounds(const Position& pos) const;
	int countWalls() const;

	int getSize() const;

	bool operator==(const Board& other) const;
	bool operator!=(const Board& other) const;

private:
	int size;
	std::vector<std::uint8_t> cells;

	void reset(int boardSize);
	int index(int row, int col) const;
	void setBit(int row, int col, int dir);
};

#endif
