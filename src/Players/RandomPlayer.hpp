#ifndef RANDOMPLAYER_HPP
#define RANDOMPLAYER_HPP

#include <cstdint>

#include "IPlayer.hpp"
#include "RandomSource.hpp"

class RandomPlayer : public IPlayer {
public:
	explicit RandomPlayer(std::uint32_t seed);
	std::string name() const override;
	bool isHuman() const override;
	bool autoplay() const override;
	Move step(const Board& board, const Position& myPos, const Position& advPos, int maxStep) override;

private:
	Mt19937RandomSource random;
};

#endif
