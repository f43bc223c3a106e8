#include "GreedyPlayer.hpp"

#include <deque>
#include <limits>
#include <utility>

#include "Config.hpp"
#include "Connectivity.hpp"
#include "Direction.hpp"
#include "RandomWalk.hpp"
#include "Rules.hpp"

namespace {
// Finished games rank above every territory estimate.
constexpr int kEndgameWeight = 100000;
}

GreedyPlayer::GreedyPlayer(std::uint32_t seed) : random(seed) {
}

std::string GreedyPlayer::name() const {
	return "greedy_agent";
}

bool GreedyPlayer::isHuman() const {
	return false;
}

bool GreedyPlayer::autoplay() const {
	return true;
}

Move GreedyPlayer::step(const Board& board, const Position& myPos, const Position& advPos, int maxStep) {
	std::vector<Position> cells = Rules::reachableCells(board, myPos, advPos, maxStep);
	for (size_t i = cells.size(); i > 1; --i) {
		size_t j = static_cast<size_t>(random.uniformInt(0, static_cast<int>(i) - 1));
		std::swap(cells[i - 1], cells[j]);
	}

	int bestScore = std::numeric_limits<int>::min();
	Move bestMove;
	int evaluated = 0;
	for (const Position& cell : cells) {
		for (int dir = 0; dir < Directions::kCount; ++dir) {
			if (board.isWall(cell, dir)) {
				continue;
			}
			if (evaluated >= Config::kGreedyMaxCandidates) {
				break;
			}
			++evaluated;
			Board next = board;
			next.setWall(cell, dir);
			EndgameResult result = Connectivity::checkEndgame(next, cell, advPos);
			int score = 0;
			if (result.ended) {
				int margin = result.scoreA - result.scoreB;
				score = (margin > 0) ? kEndgameWeight + margin : -kEndgameWeight + margin;
			} else {
				score = territoryMargin(next, cell, advPos);
			}
			if (score > bestScore) {
				bestScore = score;
				bestMove = Move(cell, dir);
			}
		}
	}
	if (evaluated == 0) {
		return randomWalk(board, myPos, advPos, maxStep, random);
	}
	return bestMove;
}

int GreedyPlayer::territoryMargin(const Board& board, const Position& myPos, const Position& advPos) {
	std::vector<int> mine = distancesFrom(board, myPos);
	std::vector<int> theirs = distancesFrom(board, advPos);
	int margin = 0;
	for (size_t i = 0; i < mine.size(); ++i) {
		if (mine[i] < theirs[i]) {
			++margin;
		} else if (theirs[i] < mine[i]) {
			--margin;
		}
	}
	return margin;
}

std::vector<int> GreedyPlayer::distancesFrom(const Board& board, const Position& origin) {
	int size = board.getSize();
	std::vector<int> dist(static_cast<size_t>(size * size), std::numeric_limits<int>::max());
	std::deque<Position> queue;
	dist[origin.index(size)] = 0;
	queue.push_back(origin);
	while (!queue.empty()) {
		Position cur = queue.front();
		queue.pop_front();
		for (int dir = 0; dir < Directions::kCount; ++dir) {
			if (board.isWall(cur, dir)) {
				continue;
			}
			Position next = cur.neighbor(dir);
			if (dist[next.index(size)] != std::numeric_limits<int>::max()) {
				continue;
			}
			dist[next.index(size)] = dist[cur.index(size)] + 1;
			queue.push_back(next);
		}
	}
	return dist;
}
