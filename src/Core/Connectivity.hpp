#ifndef CONNECTIVITY_HPP
#define CONNECTIVITY_HPP

#include "Board.hpp"
#include "Position.hpp"

struct EndgameResult {
	bool ended;
	int scoreA;
	int scoreB;

	EndgameResult();
	EndgameResult(bool isEnded, int a, int b);
	bool operator==(const EndgameResult& other) const;
};

namespace Connectivity {
// Scores are partition sizes; when not ended both equal the shared partition.
EndgameResult checkEndgame(const Board& board, const Position& posA, const Position& posB);
int partitionCount(const Board& board);
}

#endif
