#include "core/constants.hpp"
#include "models/formation_config.hpp"

#include <format>

namespace teamdraw {

auto formation_config::leader_candidates() const -> participant_view
{
	if (is_flat()) {
		return all_people();
	}

	participant_view out;
	for (const auto &a : attendees) {
		if (a.is_leader()) {
			out.emplace_back(a.person);
		}
	}
	return out;
}

auto formation_config::normal_attendees() const -> participant_view
{
	if (is_flat()) {
		return {};
	}

	participant_view out;
	for (const auto &a : attendees) {
		if (!a.is_leader()) {
			out.emplace_back(a.person);
		}
	}
	return out;
}

auto formation_config::all_people() const -> participant_view
{
	participant_view out;
	out.reserve(attendees.size());
	for (const auto &a : attendees) {
		out.emplace_back(a.person);
	}
	return out;
}

auto formation_config::validate() const -> type::result<type::ok_t>
{
	if (num_teams == 0) {
		return std::unexpected(type::error{type::error_code::zero_teams, constants::text::teams_must_positive});
	}

	const auto available = leader_candidates().size();
	if (available < num_teams) {
		type::error err{type::error_code::insufficient_leaders,
										std::format("{}: {} available, {} required", constants::text::leaders_not_enough, available, num_teams)};
		err.available = available;
		err.required = num_teams;
		return std::unexpected(std::move(err));
	}

	return type::ok_t{};
}

} // namespace teamdraw
