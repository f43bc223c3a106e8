#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>

namespace Config {
constexpr int kMinBoardSize = 6;
constexpr int kMaxBoardSize = 12;
constexpr int kDisplayDelayMs = 2000;
constexpr double kSlowTurnSeconds = 2.0;
constexpr double kWarnTurnSeconds = 1.0;
constexpr int kAutoplayRuns = 100;
constexpr std::uint32_t kDefaultSeed = 424;
constexpr int kGreedyMaxCandidates = 400;
}

#endif
