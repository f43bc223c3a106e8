#include "RandomPlayer.hpp"

#include "RandomWalk.hpp"

RandomPlayer::RandomPlayer(std::uint32_t seed) : random(seed) {
}

std::string RandomPlayer::name() const {
	return "random_agent";
}

bool RandomPlayer::isHuman() const {
	return false;
}

bool RandomPlayer::autoplay() const {
	return true;
}

Move RandomPlayer::step(const Board& board, const Position& myPos, const Position& advPos, int maxStep) {
	return randomWalk(board, myPos, advPos, maxStep, random);
}
