#pragma once

#include "core/utils.hpp"
#include "models/formation_config.hpp"
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>

namespace teamdraw {

// Reads formation settings documents. Only the document shape is checked here,
// formation_config::validate() owns the domain rules.
class settings_service {
public:
	[[nodiscard]] static auto parse(const nlohmann::json &j) -> type::result<formation_config>;
	[[nodiscard]] static auto parse_text(std::string_view text) -> type::result<formation_config>;
	[[nodiscard]] static auto load(const std::filesystem::path &path) -> type::result<formation_config>;
};

} // namespace teamdraw
