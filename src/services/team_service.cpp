#include "services/team_service.hpp"

#include <variant>

namespace teamdraw {

auto team_service::form_teams(const formation_config &config, any_shuffle &strategy) -> type::result<team_set>
{
	return std::visit([&config](auto &s) { return form_teams(config, s); }, strategy);
}

auto team_service::create_by_leader_candidates(std::vector<participant> candidates, std::size_t num_teams)
		-> std::pair<std::vector<team>, std::vector<participant>>
{
	std::vector<team> teams;
	teams.reserve(num_teams);

	while (teams.size() < num_teams && !candidates.empty()) {
		teams.emplace_back(std::move(candidates.back()));
		candidates.pop_back();
	}

	return {std::move(teams), std::move(candidates)};
}

auto team_service::distribute_round_robin(std::span<team> teams, std::vector<participant> &pool) -> void
{
	if (teams.empty()) {
		return;
	}

	while (!pool.empty()) {
		for (auto &t : teams) {
			// out of people mid-pass: the remaining teams of this pass get nobody
			if (pool.empty()) {
				break;
			}
			t.assign(std::move(pool.back()));
			pool.pop_back();
		}
	}
}

auto team_service::to_owned(const participant_view &view) -> std::vector<participant>
{
	return std::vector<participant>(view.begin(), view.end());
}

} // namespace teamdraw
