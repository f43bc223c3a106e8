#ifndef MOVEHISTORY_HPP
#define MOVEHISTORY_HPP

#include <string>
#include <vector>
#include "GameState.hpp"
#include "Move.hpp"

class MoveHistory {
public:
	struct HistoryEntry {
		Move move;
		GameState::PlayerId player;
		double elapsedSeconds;
		bool fallback;
		std::string failureReason;
	};

	void clear();
	void push(const HistoryEntry& entry);
	size_t size() const;
	int fallbackCount(GameState::PlayerId player) const;
	const std::vector<HistoryEntry>& all() const;

private:
	std::vector<HistoryEntry> entries;
};

#endif
