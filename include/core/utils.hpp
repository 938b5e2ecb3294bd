#pragma once

#include <concepts>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace teamdraw {

namespace type {

enum class error_code {
	zero_teams,
	insufficient_leaders,
	shuffle_failed,
	invalid_config,
	io_failure,
	invalid_argument,
};

// Error handling
struct error {
	error_code code{error_code::invalid_config};
	std::string message;

	// Only meaningful for error_code::insufficient_leaders
	std::size_t available{};
	std::size_t required{};

	constexpr error(std::string_view sv) : message(sv) {}
	constexpr error(error_code c, std::string_view sv) : code(c), message(sv) {}

	constexpr error() = default;
	constexpr error(const error &) = default;
	constexpr error(error &&) noexcept = default;
	constexpr error &operator=(const error &) = default;
	constexpr error &operator=(error &&) noexcept = default;

	// explicit object parameter
	[[nodiscard]] auto what(this const auto &self) -> std::string_view { return self.message; }
};

using ok_t = std::monostate;

template <typename T>
using result = std::expected<T, error>;

} // namespace type

namespace util {

// Explicit (silent) narrowing cast, a named static_cast.
template <std::integral To, std::integral From>
[[nodiscard]] constexpr To narrow_cast(From v) noexcept
{
	return static_cast<To>(v);
}

} // namespace util

} // namespace teamdraw
