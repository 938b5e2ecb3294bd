#include "core/constants.hpp"
#include "handlers/command_handler.hpp"
#include "services/settings_service.hpp"
#include "services/team_service.hpp"

#include <charconv>
#include <format>

namespace teamdraw {

namespace {

auto bad_argument(std::string_view msg) -> std::unexpected<type::error>
{
	return std::unexpected(type::error{type::error_code::invalid_argument, msg});
}

} // namespace

auto command_handler::parse_args(std::span<const std::string_view> args) -> type::result<cli_options>
{
	cli_options opts;
	bool have_path = false;

	for (std::size_t i = 0; i < args.size(); ++i) {
		const auto arg = args[i];

		if (arg == "--no-shuffle") {
			opts.no_shuffle = true;
			continue;
		}

		if (arg == "--format" || arg == "--seed") {
			if (i + 1 >= args.size()) {
				return bad_argument(std::format("{} {}", constants::text::bad_option_value, arg));
			}
			const auto value = args[++i];

			if (arg == "--format") {
				if (value == "json")
					opts.format = ui::output_format::json;
				else if (value == "text")
					opts.format = ui::output_format::text;
				else
					return bad_argument(std::format("{} {}: {}", constants::text::bad_option_value, arg, value));
			}
			else {
				std::uint64_t seed{};
				auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seed);
				if (ec != std::errc{} || ptr != value.data() + value.size()) {
					return bad_argument(std::format("{} {}: {}", constants::text::bad_option_value, arg, value));
				}
				opts.seed = seed;
			}
			continue;
		}

		if (arg.starts_with("--") || have_path) {
			return bad_argument(std::format("{}: {}", constants::text::unknown_option, arg));
		}

		opts.settings_path = std::filesystem::path{arg};
		have_path = true;
	}

	if (!have_path) {
		return bad_argument(constants::text::usage);
	}

	if (opts.seed && opts.no_shuffle) {
		return bad_argument(constants::text::conflicting_options);
	}

	return opts;
}

auto command_handler::make_strategy(const cli_options &opts) -> any_shuffle
{
	if (opts.no_shuffle)
		return identity_shuffle{};
	if (opts.seed)
		return seeded_shuffle{*opts.seed};
	return random_shuffle{};
}

auto command_handler::run(const cli_options &opts, std::ostream &out, std::ostream &err) -> int
{
	auto config = settings_service::load(opts.settings_path);
	if (!config) {
		err << constants::text::err_prefix << config.error().what() << "\n";
		return exit_failure;
	}

	auto strategy = make_strategy(opts);
	auto teams = team_service::form_teams(*config, strategy);
	if (!teams) {
		err << constants::text::err_prefix << teams.error().what() << "\n";
		return exit_failure;
	}

	out << ui::result_builder::build(*teams, opts.format);
	return exit_ok;
}

} // namespace teamdraw
