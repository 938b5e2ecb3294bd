#include "core/constants.hpp"
#include "models/team.hpp"

#include <algorithm>
#include <functional>
#include <ranges>

namespace teamdraw {

auto team_set::participant_count() const -> std::size_t
{
	return std::ranges::fold_left(teams_ | std::views::transform([](const team &t) { return t.size(); }), std::size_t{0}, std::plus{});
}

auto team_set::to_json() const -> nlohmann::json
{
	nlohmann::json out;
	out[constants::keys::team] = nlohmann::json::array();
	for (const auto &t : teams_) {
		out[constants::keys::team].push_back(t.to_json());
	}
	return out;
}

} // namespace teamdraw
