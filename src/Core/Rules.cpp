#include "Rules.hpp"

#include <deque>
#include <sstream>
#include <utility>

#include "Direction.hpp"

namespace Rules {
namespace {
void setReason(std::string* reason, const std::string& text) {
	if (reason) {
		*reason = text;
	}
}
}

int maxStepFor(int boardSize) {
	return (boardSize + 2) / 2;
}

bool checkValidStep(const Board& board, const Position& start, const Position& end, int barrierDir,
	const Position& advPos, int maxStep) {
	if (board.isWall(end, barrierDir)) {
		return false;
	}
	if (start == end) {
		return true;
	}

	int size = board.getSize();
	std::vector<bool> visited(static_cast<size_t>(size * size), false);
	visited[start.index(size)] = true;
	std::deque<std::pair<Position, int> > queue;
	queue.push_back(std::make_pair(start, 0));
	while (!queue.empty()) {
		Position cur = queue.front().first;
		int step = queue.front().second;
		queue.pop_front();
		if (step == maxStep) {
			break;
		}
		for (int dir = 0; dir < Directions::kCount; ++dir) {
			if (board.isWall(cur, dir)) {
				continue;
			}
			Position next = cur.neighbor(dir);
			if (next == advPos || visited[next.index(size)]) {
				continue;
			}
			if (next == end) {
				return true;
			}
			visited[next.index(size)] = true;
			queue.push_back(std::make_pair(next, step + 1));
		}
	}
	return false;
}

bool validateMove(const Board& board, const Position& myPos, const Position& advPos, int maxStep,
	const Move& move, std::string* reason) {
	if (!board.inBounds(move.destination)) {
		std::ostringstream out;
		out << "End position " << move.destination << " is out of boundary";
		setReason(reason, out.str());
		return false;
	}
	if (!Directions::isValid(move.direction)) {
		std::ostringstream out;
		out << "Barrier dir should reside in [0, 3], but the dir is " << move.direction;
		setReason(reason, out.str());
		return false;
	}
	if (!checkValidStep(board, myPos, move.destination, move.direction, advPos, maxStep)) {
		std::ostringstream out;
		out << "Not a valid step from " << myPos << " to " << move.destination << " and put barrier at "
			<< Directions::name(move.direction) << ", with max steps = " << maxStep;
		setReason(reason, out.str());
		return false;
	}
	return true;
}

std::vector<Position> reachableCells(const Board& board, const Position& start, const Position& advPos, int maxStep) {
	int size = board.getSize();
	std::vector<bool> visited(static_cast<size_t>(size * size), false);
	std::vector<Position> cells;
	visited[start.index(size)] = true;
	cells.push_back(start);
	std::deque<std::pair<Position, int> > queue;
	queue.push_back(std::make_pair(start, 0));
	while (!queue.empty()) {
		Position cur = queue.front().first;
		int step = queue.front().second;
		queue.pop_front();
		if (step == maxStep) {
			continue;
		}
		for (int dir = 0; dir < Directions::kCount; ++dir) {
			if (board.isWall(cur, dir)) {
				continue;
			}
			Position next = cur.neighbor(dir);
			if (next == advPos || visited[next.index(size)]) {
				continue;
			}
			visited[next.index(size)] = true;
			cells.push_back(next);
			queue.push_back(std::make_pair(next, step + 1));
		}
	}
	return cells;
}
}
