#pragma once

#include <cstddef>
#include <string_view>

namespace teamdraw::constants {

// Messages
namespace text {
inline constexpr std::string_view teams_must_positive = "num_of_teams must be more than zero";
inline constexpr std::string_view leaders_not_enough = "not enough leader candidates";
inline constexpr std::string_view shuffle_failed = "failed to shuffle";
inline constexpr std::string_view cannot_open = "cannot open settings file";
inline constexpr std::string_view invalid_settings = "invalid settings";

inline constexpr std::string_view unknown_option = "unknown option";
inline constexpr std::string_view bad_option_value = "bad value for option";
inline constexpr std::string_view conflicting_options = "--seed and --no-shuffle cannot be combined";

inline constexpr std::string_view usage = "usage: teamdraw <settings.json> [--format json|text] [--seed N] [--no-shuffle]";
inline constexpr std::string_view err_prefix = "error: ";
} // namespace text

// Settings / result document keys
namespace keys {
inline constexpr std::string_view attendees = "attendees";
inline constexpr std::string_view num_of_teams = "num_of_teams";
inline constexpr std::string_view flat = "flat";
inline constexpr std::string_view person = "person";
inline constexpr std::string_view name = "name";
inline constexpr std::string_view leader = "leader";
inline constexpr std::string_view team = "team";
inline constexpr std::string_view member = "member";
} // namespace keys

// Limits
namespace limits {
inline constexpr std::size_t max_teams = 255;
} // namespace limits

} // namespace teamdraw::constants
