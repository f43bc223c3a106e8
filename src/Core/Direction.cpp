#include "Direction.hpp"

#include <cctype>

namespace Directions {
namespace {
const int kRowDeltas[kCount] = {-1, 0, 1, 0};
const int kColDeltas[kCount] = {0, 1, 0, -1};
const char* const kNames[kCount] = {"Up", "Right", "Down", "Left"};
}

bool isValid(int dir) {
	return dir >= 0 && dir < kCount;
}

int opposite(int dir) {
	return (dir + 2) % kCount;
}

int rowDelta(int dir) {
	return kRowDeltas[dir];
}

int colDelta(int dir) {
	return kColDeltas[dir];
}

const char* name(int dir) {
	if (!isValid(dir)) {
		return "Invalid";
	}
	return kNames[dir];
}

bool parse(char symbol, int& outDir) {
	switch (std::tolower(static_cast<unsigned char>(symbol))) {
	case 'u':
	case '0':
		outDir = Up;
		return true;
	case 'r':
	case '1':
		outDir = Right;
		return true;
	case 'd':
	case '2':
		outDir = Down;
		return true;
	case 'l':
	case '3':
		outDir = Left;
		return true;
	default:
		return false;
	}
}
}
