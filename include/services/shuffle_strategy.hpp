#pragma once

#include "core/utils.hpp"
#include "models/participant.hpp"

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <random>
#include <variant>
#include <vector>

namespace teamdraw {

// Leaves the sequence untouched, which makes formation deterministic.
class identity_shuffle {
public:
	template <typename T>
	[[nodiscard]] auto shuffle(std::vector<T> &) const -> type::result<type::ok_t>
	{
		return type::ok_t{};
	}
};

// Fisher–Yates over a fresh engine per call, seeded from std::random_device.
class random_shuffle {
public:
	template <typename T>
	[[nodiscard]] auto shuffle(std::vector<T> &v) const -> type::result<type::ok_t>
	{
		auto seed = device_seed();
		if (!seed) {
			return std::unexpected(std::move(seed.error()));
		}

		std::mt19937_64 rng{*seed};
		std::ranges::shuffle(v, rng);
		return type::ok_t{};
	}

private:
	[[nodiscard]] static auto device_seed() -> type::result<std::uint64_t>;
};

// Reproducible: the same seed over the same input yields the same sequence of permutations.
class seeded_shuffle {
public:
	explicit seeded_shuffle(std::uint64_t seed) : rng_{seed} {}

	template <typename T>
	[[nodiscard]] auto shuffle(std::vector<T> &v) -> type::result<type::ok_t>
	{
		std::ranges::shuffle(v, rng_);
		return type::ok_t{};
	}

private:
	std::mt19937_64 rng_;
};

template <typename S>
concept shuffle_strategy = requires(S &s, std::vector<participant> &v) {
	{ s.shuffle(v) } -> std::same_as<type::result<type::ok_t>>;
};

// Run-time selectable strategy, e.g. from command line options
using any_shuffle = std::variant<identity_shuffle, random_shuffle, seeded_shuffle>;

static_assert(shuffle_strategy<identity_shuffle>);
static_assert(shuffle_strategy<random_shuffle>);
static_assert(shuffle_strategy<seeded_shuffle>);

} // namespace teamdraw
