#include "core/constants.hpp"
#include "services/shuffle_strategy.hpp"

#include <exception>
#include <format>

namespace teamdraw {

auto random_shuffle::device_seed() -> type::result<std::uint64_t>
{
	try { // std::random_device throws when no entropy source is available
		std::random_device rd;
		// 64-bit seed out of two 32-bit draws
		const auto high = static_cast<std::uint64_t>(rd()) << 32;
		const auto low = static_cast<std::uint64_t>(rd());
		return high ^ low;
	} catch (const std::exception &e) {
		return std::unexpected(type::error{type::error_code::shuffle_failed, std::format("{}: {}", constants::text::shuffle_failed, e.what())});
	}
}

} // namespace teamdraw
