#include "Move.hpp"

Move::Move() : destination(), direction(-1) {
}

Move::Move(const Position& dest, int dir) : destination(dest), direction(dir) {
}

bool Move::operator==(const Move& other) const {
	return destination == other.destination && direction == other.direction;
}

