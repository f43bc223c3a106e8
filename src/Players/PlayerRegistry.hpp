#ifndef PLAYERREGISTRY_HPP
#define PLAYERREGISTRY_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "IPlayer.hpp"

class PlayerRegistry {
public:
	using Factory = std::function<std::unique_ptr<IPlayer>(std::uint32_t seed)>;

	PlayerRegistry();

	static const PlayerRegistry& instance();

	void add(const std::string& name, const Factory& factory);
	bool contains(const std::string& name) const;
	std::vector<std::string> names() const;
	std::unique_ptr<IPlayer> create(const std::string& name, std::uint32_t seed, std::string* reason = nullptr) const;

private:
	std::map<std::string, Factory> factories;
};

#endif
