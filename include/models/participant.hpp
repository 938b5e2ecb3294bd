#pragma once

#include "core/constants.hpp"
#include <nlohmann/json.hpp>

#include <compare>
#include <string>

namespace teamdraw {

class participant {
public:
	std::string name;

	// defaulted three-way comparison
	[[nodiscard]] auto operator<=>(const participant &) const = default;

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json { return {{constants::keys::name, self.name}}; }

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> participant
	{
		return {.name = j.at(constants::keys::name).get<std::string>()};
	}
};

} // namespace teamdraw
