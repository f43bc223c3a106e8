#ifndef POSITION_HPP
#define POSITION_HPP

#include <ostream>

class Position {
public:
	int row;
	int col;

	Position();
	Position(int rowPos, int colPos);

	bool operator==(const Position& other) const;
	bool operator!=(const Position& other) const;
	Position neighbor(int dir) const;
	Position mirrored(int boardSize) const;
	int index(int boardSize) const;
};

std::ostream& operator<<(std::ostream& out, const Position& pos);

#endif
