#ifndef RANDOMSOURCE_HPP
#define RANDOMSOURCE_HPP

#include <cstdint>
#include <random>

class IRandomSource {
public:
	virtual ~IRandomSource() = default;
	// Uniform over [low, high], both inclusive.
	virtual int uniformInt(int low, int high) = 0;
};

class Mt19937RandomSource : public IRandomSource {
public:
	explicit Mt19937RandomSource(std::uint32_t seed);

	int uniformInt(int low, int high) override;

private:
	std::mt19937 engine;
};

#endif
