#pragma once

#include "models/participant.hpp"

#include <span>
#include <vector>

namespace teamdraw {

class team {
public:
	participant leader;
	std::vector<participant> members;

	explicit team(participant l) : leader(std::move(l)) {}

	// Append-only; the caller guarantees a participant is assigned once.
	auto assign(this auto &self, participant p) -> void { self.members.push_back(std::move(p)); }

	// leader included
	[[nodiscard]] auto size(this const auto &self) -> std::size_t { return self.members.size() + 1; }

	[[nodiscard]] auto to_json(this const auto &self) -> nlohmann::json
	{
		nlohmann::json tj;
		tj[constants::keys::leader] = self.leader.to_json();
		tj[constants::keys::member] = nlohmann::json::array();
		for (const auto &m : self.members) {
			tj[constants::keys::member].push_back(m.to_json());
		}
		return tj;
	}
};

// Ordered by creation; read-only once formed.
class team_set {
public:
	team_set() = default;
	explicit team_set(std::vector<team> teams) : teams_(std::move(teams)) {}

	[[nodiscard]] auto teams() const -> std::span<const team> { return teams_; }
	[[nodiscard]] auto size() const -> std::size_t { return teams_.size(); }
	[[nodiscard]] auto operator[](std::size_t i) const -> const team & { return teams_[i]; }

	[[nodiscard]] auto begin() const { return teams_.begin(); }
	[[nodiscard]] auto end() const { return teams_.end(); }

	// leaders included
	[[nodiscard]] auto participant_count() const -> std::size_t;

	[[nodiscard]] auto to_json() const -> nlohmann::json;

private:
	std::vector<team> teams_;
};

} // namespace teamdraw
