#ifndef MOVE_HPP
#define MOVE_HPP

#include "Position.hpp"

class Move {
public:
	Position destination;
	int direction;

	Move();
	Move(const Position& dest, int dir);

	bool operator==(const Move& other) const;
};

#endif
