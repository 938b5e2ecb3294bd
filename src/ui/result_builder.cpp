#include "ui/result_builder.hpp"

#include <format>

namespace teamdraw::ui {

auto result_builder::build_json(const team_set &teams) -> std::string { return teams.to_json().dump(2) + "\n"; }

auto result_builder::build_text(const team_set &teams) -> std::string
{
	std::string out;

	for (std::size_t i = 0; i < teams.size(); ++i) {
		out += format_team(i, teams[i]);
		out += "\n";
	}

	out += std::format("{} teams, {} participants\n", teams.size(), teams.participant_count());
	return out;
}

auto result_builder::build(const team_set &teams, output_format fmt) -> std::string
{
	switch (fmt) {
	case output_format::json:
		return build_json(teams);
	case output_format::text:
		return build_text(teams);
	}
	return build_json(teams);
}

auto result_builder::format_team(std::size_t index, const team &t) -> std::string
{
	std::string result = std::format("Team {} ({} people)\n", index + 1, t.size());
	result += std::format("  leader: {}\n", t.leader.name);

	for (const auto &member : t.members) {
		result += std::format("  member: {}\n", member.name);
	}

	return result;
}

} // namespace teamdraw::ui
