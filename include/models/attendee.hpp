#pragma once

#include "models/participant.hpp"

#include <optional>

namespace teamdraw {

class attendee {
public:
	participant person;
	std::optional<bool> leader{}; // unset = not a leader candidate

	[[nodiscard]] auto is_leader(this const auto &self) -> bool { return self.leader.value_or(false); }

	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> attendee
	{
		attendee a{.person = participant::from_json(j.at(constants::keys::person))};
		if (auto it = j.find(constants::keys::leader); it != j.end() && !it->is_null()) {
			a.leader = it->get<bool>();
		}
		return a;
	}
};

} // namespace teamdraw
