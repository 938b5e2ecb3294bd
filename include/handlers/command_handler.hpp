#pragma once

#include "core/utils.hpp"
#include "services/shuffle_strategy.hpp"
#include "ui/result_builder.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string_view>

namespace teamdraw {

struct cli_options {
	std::filesystem::path settings_path{};
	ui::output_format format{ui::output_format::json};
	std::optional<std::uint64_t> seed{};
	bool no_shuffle{false};
};

class command_handler {
public:
	// Exit codes
	static constexpr int exit_ok = 0;
	static constexpr int exit_failure = 1;
	static constexpr int exit_usage = 2;

	// `args` excludes the program name
	[[nodiscard]] static auto parse_args(std::span<const std::string_view> args) -> type::result<cli_options>;

	[[nodiscard]] static auto make_strategy(const cli_options &opts) -> any_shuffle;

	// Load, form, render. Results go to `out`, diagnostics to `err`.
	[[nodiscard]] static auto run(const cli_options &opts, std::ostream &out, std::ostream &err) -> int;
};

} // namespace teamdraw
