#ifndef MOVEOUTCOME_HPP
#define MOVEOUTCOME_HPP

#include <string>
#include "Move.hpp"

struct MoveOutcome {
	enum class Kind { ValidMove, InvalidMove, FatalAbort };

	Kind kind;
	Move move;
	std::string reason;

	static MoveOutcome valid(const Move& move) {
		return MoveOutcome{Kind::ValidMove, move, std::string()};
	}

	static MoveOutcome invalid(const std::string& reason) {
		return MoveOutcome{Kind::InvalidMove, Move(), reason};
	}

	static MoveOutcome fatal(const std::string& reason) {
		return MoveOutcome{Kind::FatalAbort, Move(), reason};
	}
};

#endif
