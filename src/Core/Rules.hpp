#ifndef RULES_HPP
#define RULES_HPP

#include <string>
#include <vector>
#include "Board.hpp"
#include "Move.hpp"
#include "Position.hpp"

namespace Rules {
int maxStepFor(int boardSize);

// Reachable in at most maxStep edges without crossing a wall or the adversary's cell.
bool checkValidStep(const Board& board, const Position& start, const Position& end, int barrierDir,
	const Position& advPos, int maxStep);
bool validateMove(const Board& board, const Position& myPos, const Position& advPos, int maxStep,
	const Move& move, std::string* reason = nullptr);
std::vector<Position> reachableCells(const Board& board, const Position& start, const Position& advPos, int maxStep);
}

#endif
