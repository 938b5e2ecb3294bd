#pragma once

#include "core/utils.hpp"
#include "models/attendee.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace teamdraw {

// Borrowed view into a formation_config; valid as long as the config is.
using participant_view = std::vector<std::reference_wrapper<const participant>>;

class formation_config {
public:
	std::vector<attendee> attendees;
	std::size_t num_teams{};
	std::optional<bool> flat{}; // unset = leaders and normal attendees are distinguished

	[[nodiscard]] auto is_flat(this const auto &self) -> bool { return self.flat.value_or(false); }

	// Participant classification, input order preserved.
	// With flat set, everybody is a leader candidate and nobody is a normal attendee.
	[[nodiscard]] auto leader_candidates() const -> participant_view;
	[[nodiscard]] auto normal_attendees() const -> participant_view;
	[[nodiscard]] auto all_people() const -> participant_view;

	// zero_teams is reported before insufficient_leaders
	[[nodiscard]] auto validate() const -> type::result<type::ok_t>;
};

} // namespace teamdraw
