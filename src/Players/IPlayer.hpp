#ifndef IPLAYER_HPP
#define IPLAYER_HPP

#include <stdexcept>
#include <string>

#include "Board.hpp"
#include "Move.hpp"
#include "Position.hpp"

// Raised by a human-operated player to stop the whole program.
class AbortRequested : public std::runtime_error {
public:
	explicit AbortRequested(const std::string& what) : std::runtime_error(what) {
	}
};

class IPlayer {
public:
	virtual ~IPlayer() = default;
	virtual std::string name() const = 0;
	virtual bool isHuman() const = 0;
	virtual bool autoplay() const = 0;
	virtual Move step(const Board& board, const Position& myPos, const Position& advPos, int maxStep) = 0;
};

#endif
