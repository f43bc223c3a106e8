#include "RandomWalk.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

#include "Direction.hpp"

Move randomWalk(const Board& board, const Position& myPos, const Position& advPos, int maxStep, IRandomSource& random) {
	Position cur = myPos;
	int steps = random.uniformInt(0, maxStep);
	std::vector<int> allowed;
	for (int i = 0; i < steps; ++i) {
		allowed.clear();
		for (int dir = 0; dir < Directions::kCount; ++dir) {
			if (!board.isWall(cur, dir) && cur.neighbor(dir) != advPos) {
				allowed.push_back(dir);
			}
		}
		if (allowed.empty()) {
			break;
		}
		int dir = allowed[static_cast<size_t>(random.uniformInt(0, static_cast<int>(allowed.size()) - 1))];
		cur = cur.neighbor(dir);
	}

	allowed.clear();
	for (int dir = 0; dir < Directions::kCount; ++dir) {
		if (!board.isWall(cur, dir)) {
			allowed.push_back(dir);
		}
	}
	if (allowed.empty()) {
		std::ostringstream out;
		out << "Cell " << cur << " is walled on all four sides";
		throw std::logic_error(out.str());
	}
	int dir = allowed[static_cast<size_t>(random.uniformInt(0, static_cast<int>(allowed.size()) - 1))];
	return Move(cur, dir);
}
