#include "RandomSource.hpp"

Mt19937RandomSource::Mt19937RandomSource(std::uint32_t seed) : engine(seed) {
}

int Mt19937RandomSource::uniformInt(int low, int high) {
	std::uniform_int_distribution<int> dist(low, high);
	return dist(engine);
}
