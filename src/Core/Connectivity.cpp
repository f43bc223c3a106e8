#include "Connectivity.hpp"

#include "DisjointSet.hpp"
#include "Direction.hpp"

EndgameResult::EndgameResult() : ended(false), scoreA(0), scoreB(0) {
}

EndgameResult::EndgameResult(bool isEnded, int a, int b) : ended(isEnded), scoreA(a), scoreB(b) {
}

bool EndgameResult::operator==(const EndgameResult& other) const {
	return ended == other.ended && scoreA == other.scoreA && scoreB == other.scoreB;
}

namespace Connectivity {
namespace {
void buildPartitions(const Board& board, DisjointSet& sets) {
	int size = board.getSize();
	for (int r = 0; r < size; ++r) {
		for (int c = 0; c < size; ++c) {
			// Each edge is seen once, from its upper or left cell.
			if (!board.isWall(r, c, Directions::Right)) {
				sets.unite(r * size + c, r * size + c + 1);
			}
			if (!board.isWall(r, c, Directions::Down)) {
				sets.unite(r * size + c, (r + 1) * size + c);
			}
		}
	}
}
}

EndgameResult checkEndgame(const Board& board, const Position& posA, const Position& posB) {
	int size = board.getSize();
	int cellCount = size * size;
	DisjointSet sets(cellCount);
	buildPartitions(board, sets);

	int rootA = sets.find(posA.index(size));
	int rootB = sets.find(posB.index(size));
	int scoreA = 0;
	int scoreB = 0;
	for (int i = 0; i < cellCount; ++i) {
		int root = sets.find(i);
		if (root == rootA) {
			++scoreA;
		}
		if (root == rootB) {
			++scoreB;
		}
	}
	return EndgameResult(rootA != rootB, scoreA, scoreB);
}

int partitionCount(const Board& board) {
	int size = board.getSize();
	DisjointSet sets(size * size);
	buildPartitions(board, sets);
	return sets.setCount();
}
}
