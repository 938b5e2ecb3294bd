#include "services/settings_service.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace teamdraw;

namespace {

auto data_file(const std::string &name) -> std::filesystem::path { return std::filesystem::path{TEAMDRAW_TEST_DATA_DIR} / name; }

} // namespace

TEST(SettingsServiceTest, ParsesFullDocument)
{
	auto res = settings_service::parse_text(R"({
		"attendees": [
			{"person": {"name": "A"}, "leader": true},
			{"person": {"name": "B"}, "leader": false},
			{"person": {"name": "C"}}
		],
		"num_of_teams": 1,
		"flat": true
	})");
	ASSERT_TRUE(res.has_value()) << res.error().what();

	const auto &cfg = *res;
	ASSERT_EQ(cfg.attendees.size(), 3u);
	EXPECT_EQ(cfg.attendees[0].person.name, "A");
	EXPECT_EQ(cfg.attendees[0].leader, std::optional<bool>{true});
	EXPECT_EQ(cfg.attendees[1].leader, std::optional<bool>{false});
	EXPECT_FALSE(cfg.attendees[2].leader.has_value());
	EXPECT_EQ(cfg.num_teams, 1u);
	EXPECT_TRUE(cfg.is_flat());
}

TEST(SettingsServiceTest, FlatIsOptional)
{
	auto res = settings_service::parse_text(R"({"attendees": [], "num_of_teams": 2})");
	ASSERT_TRUE(res.has_value()) << res.error().what();

	EXPECT_FALSE(res->flat.has_value());
	EXPECT_FALSE(res->is_flat());
}

TEST(SettingsServiceTest, ZeroTeamsIsLeftToValidation)
{
	auto res = settings_service::parse_text(R"({"attendees": [], "num_of_teams": 0})");
	ASSERT_TRUE(res.has_value()) << res.error().what();

	EXPECT_EQ(res->num_teams, 0u);
	ASSERT_FALSE(res->validate().has_value());
	EXPECT_EQ(res->validate().error().code, type::error_code::zero_teams);
}

TEST(SettingsServiceTest, RejectsBadShapes)
{
	const char *documents[] = {
			R"([1, 2, 3])",
			R"({"attendees": []})",
			R"({"attendees": [], "num_of_teams": -1})",
			R"({"attendees": [], "num_of_teams": 1.5})",
			R"({"attendees": [], "num_of_teams": "2"})",
			R"({"attendees": [], "num_of_teams": 256})",
			R"({"num_of_teams": 2})",
			R"({"attendees": {}, "num_of_teams": 2})",
			R"({"attendees": [], "num_of_teams": 2, "flat": "yes"})",
			R"({"attendees": [{"name": "A"}], "num_of_teams": 2})",
			R"({"attendees": [{"person": {"name": 7}}], "num_of_teams": 2})",
			R"({"attendees": [{"person": {"name": "A"}, "leader": "true"}], "num_of_teams": 2})",
	};

	for (const char *doc : documents) {
		auto res = settings_service::parse_text(doc);
		ASSERT_FALSE(res.has_value()) << doc;
		EXPECT_EQ(res.error().code, type::error_code::invalid_config) << doc;
		EXPECT_FALSE(res.error().what().empty()) << doc;
	}
}

TEST(SettingsServiceTest, AcceptsUpperTeamLimit)
{
	auto res = settings_service::parse_text(R"({"attendees": [], "num_of_teams": 255})");
	ASSERT_TRUE(res.has_value()) << res.error().what();
	EXPECT_EQ(res->num_teams, 255u);
}

TEST(SettingsServiceTest, RejectsMalformedText)
{
	auto res = settings_service::parse_text(R"({"attendees": [)");
	ASSERT_FALSE(res.has_value());
	EXPECT_EQ(res.error().code, type::error_code::invalid_config);
}

TEST(SettingsServiceTest, LoadsFile)
{
	auto res = settings_service::load(data_file("five_attendees.json"));
	ASSERT_TRUE(res.has_value()) << res.error().what();

	EXPECT_EQ(res->attendees.size(), 5u);
	EXPECT_EQ(res->num_teams, 2u);
	EXPECT_EQ(res->leader_candidates().size(), 3u);
	EXPECT_EQ(res->normal_attendees().size(), 2u);
}

TEST(SettingsServiceTest, MissingFile)
{
	auto res = settings_service::load(data_file("does_not_exist.json"));
	ASSERT_FALSE(res.has_value());
	EXPECT_EQ(res.error().code, type::error_code::io_failure);
}

TEST(SettingsServiceTest, MalformedFile)
{
	auto res = settings_service::load(data_file("malformed.json"));
	ASSERT_FALSE(res.has_value());
	EXPECT_EQ(res.error().code, type::error_code::invalid_config);
}
