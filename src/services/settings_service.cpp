#include "core/constants.hpp"
#include "services/settings_service.hpp"

#include <format>
#include <fstream>

namespace teamdraw {

namespace {

auto invalid(std::string_view what) -> std::unexpected<type::error>
{
	return std::unexpected(type::error{type::error_code::invalid_config, std::format("{}: {}", constants::text::invalid_settings, what)});
}

} // namespace

auto settings_service::parse(const nlohmann::json &j) -> type::result<formation_config>
{
	if (!j.is_object()) {
		return invalid("document must be an object");
	}

	auto teams_it = j.find(constants::keys::num_of_teams);
	if (teams_it == j.end()) {
		return invalid(std::format("missing '{}'", constants::keys::num_of_teams));
	}
	if (!teams_it->is_number_unsigned()) {
		return invalid(std::format("'{}' must be a non-negative integer", constants::keys::num_of_teams));
	}
	const auto num_teams = teams_it->get<std::uint64_t>();
	if (num_teams > constants::limits::max_teams) {
		return invalid(std::format("'{}' must not exceed {}", constants::keys::num_of_teams, constants::limits::max_teams));
	}

	auto attendees_it = j.find(constants::keys::attendees);
	if (attendees_it == j.end() || !attendees_it->is_array()) {
		return invalid(std::format("'{}' must be an array", constants::keys::attendees));
	}

	formation_config cfg;
	cfg.num_teams = util::narrow_cast<std::size_t>(num_teams);

	if (auto flat_it = j.find(constants::keys::flat); flat_it != j.end() && !flat_it->is_null()) {
		if (!flat_it->is_boolean()) {
			return invalid(std::format("'{}' must be a boolean", constants::keys::flat));
		}
		cfg.flat = flat_it->get<bool>();
	}

	try { // The try block is for nlohmann::json
		cfg.attendees.reserve(attendees_it->size());
		for (const auto &item : *attendees_it) {
			cfg.attendees.push_back(attendee::from_json(item));
		}
	} catch (const nlohmann::json::exception &e) {
		return invalid(std::format("attendee #{}: {}", cfg.attendees.size() + 1, e.what()));
	}

	return cfg;
}

auto settings_service::parse_text(std::string_view text) -> type::result<formation_config>
{
	nlohmann::json j;
	try {
		j = nlohmann::json::parse(text);
	} catch (const nlohmann::json::parse_error &e) {
		return invalid(e.what());
	}
	return parse(j);
}

auto settings_service::load(const std::filesystem::path &path) -> type::result<formation_config>
{
	std::ifstream file(path);
	if (!file) {
		return std::unexpected(type::error{type::error_code::io_failure, std::format("{}: {}", constants::text::cannot_open, path.string())});
	}

	nlohmann::json j;
	try {
		file >> j;
	} catch (const nlohmann::json::parse_error &e) {
		return invalid(std::format("{}: {}", path.string(), e.what()));
	}
	return parse(j);
}

} // namespace teamdraw
