#include "MoveHistory.hpp"

void MoveHistory::clear() {
	entries.clear();
}

void MoveHistory::push(const HistoryEntry& entry) {
	entries.push_back(entry);
}

size_t MoveHistory::size() const {
	return entries.size();
}

int MoveHistory::fallbackCount(GameState::PlayerId player) const {
	int count = 0;
	for (const HistoryEntry& entry : entries) {
		if (entry.player == player && entry.fallback) {
			++count;
		}
	}
	return count;
}

const std::vector<MoveHistory::HistoryEntry>& MoveHistory::all() const {
	return entries;
}
