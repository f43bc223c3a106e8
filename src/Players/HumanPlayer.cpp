#include "HumanPlayer.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>

#include "Direction.hpp"

namespace {
std::string trim(const std::string& value) {
	size_t begin = 0;
	size_t end = value.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
		++begin;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
		--end;
	}
	return value.substr(begin, end - begin);
}
}  // namespace

HumanPlayer::HumanPlayer() : in(std::cin), out(std::cout) {
}

HumanPlayer::HumanPlayer(std::istream& input, std::ostream& output) : in(input), out(output) {
}

std::string HumanPlayer::name() const {
	return "human_agent";
}

bool HumanPlayer::isHuman() const {
	return true;
}

bool HumanPlayer::autoplay() const {
	return false;
}

Move HumanPlayer::step(const Board&, const Position& myPos, const Position& advPos, int maxStep) {
	for (;;) {
		out << "You are at " << myPos << ", opponent at " << advPos << ", max steps " << maxStep << ".\n"
			<< "Your move (row,col,dir) or input q or quit to quit: " << std::flush;
		std::string line;
		if (!std::getline(in, line)) {
			throw AbortRequested("Input closed");
		}
		std::string lower = trim(line);
		std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
			return static_cast<char>(std::tolower(c));
		});
		if (lower == "q" || lower == "quit") {
			throw AbortRequested("Game ended by user");
		}
		Move move;
		if (parseMove(lower, move)) {
			return move;
		}
		out << "Wrong input format! Expected row,col,dir with dir one of u, r, d, l." << std::endl;
	}
}

bool HumanPlayer::parseMove(const std::string& line, Move& outMove) {
	std::string text = line;
	std::replace(text.begin(), text.end(), ',', ' ');
	std::istringstream stream(text);
	int row = 0;
	int col = 0;
	std::string dirToken;
	if (!(stream >> row >> col >> dirToken)) {
		return false;
	}
	std::string extra;
	if (stream >> extra) {
		return false;
	}
	int dir = 0;
	if (dirToken.size() != 1 || !Directions::parse(dirToken[0], dir)) {
		return false;
	}
	outMove = Move(Position(row, col), dir);
	return true;
}
