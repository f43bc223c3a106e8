#include "Position.hpp"

#include "Direction.hpp"

Position::Position() : row(-1), col(-1) {
}

Position::Position(int rowPos, int colPos) : row(rowPos), col(colPos) {
}

bool Position::operator==(const Position& other) const {
	return row == other.row && col == other.col;
}

bool Position::operator!=(const Position& other) const {
	return !(*this == other);
}

Position Position::neighbor(int dir) const {
	return Position(row + Directions::rowDelta(dir), col + Directions::colDelta(dir));
}

Position Position::mirrored(int boardSize) const {
	return Position(boardSize - 1 - row, boardSize - 1 - col);
}

int Position::index(int boardSize) const {
	return row * boardSize + col;
}

std::ostream& operator<<(std::ostream& out, const Position& pos) {
	return out << "(" << pos.row << ", " << pos.col << ")";
}
