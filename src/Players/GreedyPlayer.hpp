#ifndef GREEDYPLAYER_HPP
#define GREEDYPLAYER_HPP

#include <cstdint>
#include <vector>

#include "IPlayer.hpp"
#include "RandomSource.hpp"

// One-ply search: take a winning wall if one exists, otherwise keep the most
// cells closer to us than to the adversary.
class GreedyPlayer : public IPlayer {
public:
	explicit GreedyPlayer(std::uint32_t seed);
	std::string name() const override;
	bool isHuman() const override;
	bool autoplay() const override;
	Move step(const Board& board, const Position& myPos, const Position& advPos, int maxStep) override;

	static int territoryMargin(const Board& board, const Position& myPos, const Position& advPos);

private:
	Mt19937RandomSource random;

	static std::vector<int> distancesFrom(const Board& board, const Position& origin);
};

#endif
