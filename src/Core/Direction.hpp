#ifndef DIRECTION_HPP
#define DIRECTION_HPP

namespace Directions {
enum Value { Up = 0, Right = 1, Down = 2, Left = 3 };

constexpr int kCount = 4;

bool isValid(int dir);
int opposite(int dir);
int rowDelta(int dir);
int colDelta(int dir);
const char* name(int dir);
bool parse(char symbol, int& outDir);
}

#endif
