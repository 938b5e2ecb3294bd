#pragma once

#include "models/team.hpp"

#include <string>

namespace teamdraw::ui {

enum class output_format { json, text };

class result_builder {
public:
	// Pretty-printed {"team": [{"leader": ..., "member": [...]}, ...]}
	[[nodiscard]] static auto build_json(const team_set &teams) -> std::string;

	// One block per team followed by a summary line
	[[nodiscard]] static auto build_text(const team_set &teams) -> std::string;

	[[nodiscard]] static auto build(const team_set &teams, output_format fmt) -> std::string;

private:
	[[nodiscard]] static auto format_team(std::size_t index, const team &t) -> std::string;
};

} // namespace teamdraw::ui
