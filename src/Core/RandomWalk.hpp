#ifndef RANDOMWALK_HPP
#define RANDOMWALK_HPP

#include "Board.hpp"
#include "Move.hpp"
#include "Position.hpp"
#include "RandomSource.hpp"

// Throws std::logic_error when the final cell has no free wall slot.
Move randomWalk(const Board& board, const Position& myPos, const Position& advPos, int maxStep, IRandomSource& random);

#endif
