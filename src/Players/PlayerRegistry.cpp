#include "PlayerRegistry.hpp"

#include "GreedyPlayer.hpp"
#include "HumanPlayer.hpp"
#include "RandomPlayer.hpp"

PlayerRegistry::PlayerRegistry() {
	add("random_agent", [](std::uint32_t seed) {
		return std::make_unique<RandomPlayer>(seed);
	});
	add("greedy_agent", [](std::uint32_t seed) {
		return std::make_unique<GreedyPlayer>(seed);
	});
	add("human_agent", [](std::uint32_t) {
		return std::make_unique<HumanPlayer>();
	});
}

const PlayerRegistry& PlayerRegistry::instance() {
	static const PlayerRegistry registry;
	return registry;
}

void PlayerRegistry::add(const std::string& name, const Factory& factory) {
	factories[name] = factory;
}

bool PlayerRegistry::contains(const std::string& name) const {
	return factories.find(name) != factories.end();
}

std::vector<std::string> PlayerRegistry::names() const {
	std::vector<std::string> result;
	for (const auto& entry : factories) {
		result.push_back(entry.first);
	}
	return result;
}

std::unique_ptr<IPlayer> PlayerRegistry::create(const std::string& name, std::uint32_t seed, std::string* reason) const {
	auto it = factories.find(name);
	if (it == factories.end()) {
		if (reason) {
			std::string known;
			for (const auto& entry : factories) {
				known += (known.empty() ? "" : ", ") + entry.first;
			}
			*reason = "Agent '" + name + "' is not registered. Known agents: " + known;
		}
		return nullptr;
	}
	return it->second(seed);
}
