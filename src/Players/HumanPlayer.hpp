#ifndef HUMANPLAYER_HPP
#define HUMANPLAYER_HPP

#include <istream>
#include <ostream>

#include "IPlayer.hpp"

class HumanPlayer : public IPlayer {
public:
	HumanPlayer();
	HumanPlayer(std::istream& input, std::ostream& output);
	std::string name() const override;
	bool isHuman() const override;
	bool autoplay() const override;
	Move step(const Board& board, const Position& myPos, const Position& advPos, int maxStep) override;

	static bool parseMove(const std::string& line, Move& outMove);

private:
	std::istream& in;
	std::ostream& out;
};

#endif
