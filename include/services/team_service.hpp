#pragma once

#include "core/utils.hpp"
#include "models/formation_config.hpp"
#include "models/team.hpp"
#include "services/shuffle_strategy.hpp"

#include <iterator>
#include <span>
#include <utility>
#include <vector>

namespace teamdraw {

class team_service {
public:
	// Validate, draw one leader per team from the shuffled candidates, then deal
	// leftover candidates and normal attendees round-robin over the teams.
	// Nothing is returned unless every participant has been placed.
	template <shuffle_strategy S>
	[[nodiscard]] static auto form_teams(const formation_config &config, S &strategy) -> type::result<team_set>;

	[[nodiscard]] static auto form_teams(const formation_config &config, any_shuffle &strategy) -> type::result<team_set>;

	// Pops leaders off the back of `candidates`, team 0 first. Expects at least
	// `num_teams` candidates; the ones not drawn are returned alongside the teams.
	[[nodiscard]] static auto create_by_leader_candidates(std::vector<participant> candidates, std::size_t num_teams)
			-> std::pair<std::vector<team>, std::vector<participant>>;

	// Pops off the back of `pool` one participant per team in team order, pass after
	// pass, stopping as soon as the pool runs dry. With no teams `pool` is left as is.
	static auto distribute_round_robin(std::span<team> teams, std::vector<participant> &pool) -> void;

private:
	[[nodiscard]] static auto to_owned(const participant_view &view) -> std::vector<participant>;
};

template <shuffle_strategy S>
auto team_service::form_teams(const formation_config &config, S &strategy) -> type::result<team_set>
{
	if (auto res = config.validate(); !res) {
		return std::unexpected(std::move(res.error()));
	}

	auto leader_pool = to_owned(config.leader_candidates());
	if (auto res = strategy.shuffle(leader_pool); !res) {
		return std::unexpected(std::move(res.error()));
	}

	auto [teams, rest] = create_by_leader_candidates(std::move(leader_pool), config.num_teams);

	auto normal = to_owned(config.normal_attendees());
	rest.insert(rest.end(), std::make_move_iterator(normal.begin()), std::make_move_iterator(normal.end()));
	if (auto res = strategy.shuffle(rest); !res) {
		return std::unexpected(std::move(res.error()));
	}

	distribute_round_robin(teams, rest);

	return team_set{std::move(teams)};
}

} // namespace teamdraw
