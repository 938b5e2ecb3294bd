#include "core/constants.hpp"
#include "handlers/command_handler.hpp"

#include <iostream>
#include <string_view>
#include <vector>

using namespace teamdraw;

int main(int argc, char **argv)
{
	std::vector<std::string_view> args(argc > 0 ? argv + 1 : argv, argv + argc);

	auto opts = command_handler::parse_args(args);
	if (!opts) {
		std::cerr << constants::text::err_prefix << opts.error().what() << "\n";
		if (opts.error().message != constants::text::usage) {
			std::cerr << constants::text::usage << "\n";
		}
		return command_handler::exit_usage;
	}

	return command_handler::run(*opts, std::cout, std::cerr);
}
