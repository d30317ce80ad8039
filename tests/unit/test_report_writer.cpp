#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/warden_errors.hpp"
#include "policy/pattern_registry.hpp"
#include "report/report_writer.hpp"

namespace {

using nlohmann::json;
using warden::core::errors::ErrorCategory;
using warden::core::errors::WardenError;
using warden::protocol::SecurityAction;

TEST(ReportWriterTest, WritesAllowWithoutOptionalFields) {
    warden::protocol::ValidationResult result;
    result.normalized_command = "npm test";

    const json payload = warden::report::result_to_json(result);
    EXPECT_EQ(payload.at("action"), "allow");
    EXPECT_EQ(payload.at("normalized_command"), "npm test");
    EXPECT_FALSE(payload.contains("reason"));
    EXPECT_FALSE(payload.contains("matched_pattern"));
}

TEST(ReportWriterTest, WritesVerdictDetails) {
    const auto result = warden::protocol::make_verdict(
        SecurityAction::Deny, "Command matches blocked security pattern", "\\bmkfs\\b",
        "filesystem-destruction");

    const json payload = warden::report::result_to_json(result);
    EXPECT_EQ(payload.at("action"), "deny");
    EXPECT_EQ(payload.at("matched_pattern"), "\\bmkfs\\b");
    EXPECT_EQ(payload.at("category"), "filesystem-destruction");
}

TEST(ReportWriterTest, WritesStats) {
    warden::stats::ValidationStatsSnapshot snapshot;
    snapshot.commands_validated = 3;
    snapshot.files_blocked = 1;
    snapshot.avg_validation_time_ms = 0.5;

    const json payload = warden::report::stats_to_json(snapshot);
    EXPECT_EQ(payload.at("commands_validated"), 3);
    EXPECT_EQ(payload.at("files_blocked"), 1);
    EXPECT_EQ(payload.at("obfuscation_detected"), 0);
    EXPECT_DOUBLE_EQ(payload.at("avg_validation_time_ms").get<double>(), 0.5);
}

TEST(ReportWriterTest, WritesErrors) {
    const WardenError error{ErrorCategory::Config, "bad pattern", "invalid_pattern", "fix it"};
    const json payload = warden::report::error_to_json(error);
    EXPECT_EQ(payload.at("error").at("category"), "config");
    EXPECT_EQ(payload.at("error").at("code"), "invalid_pattern");
    EXPECT_EQ(payload.at("error").at("hint"), "fix it");

    const json no_hint =
        warden::report::error_to_json(WardenError{ErrorCategory::Input, "x", "missing_value"});
    EXPECT_FALSE(no_hint.at("error").contains("hint"));
}

TEST(ReportWriterTest, ListsEveryRegistry) {
    auto built = warden::policy::build_pattern_set();
    ASSERT_FALSE(warden::core::errors::is_error(built));
    const auto& set = *warden::core::errors::get_value(built);

    const json payload = warden::report::pattern_set_to_json(set);
    EXPECT_EQ(payload.at("command_deny").size(), set.command_deny.size());
    EXPECT_TRUE(payload.at("command_allow").empty());
    EXPECT_EQ(payload.at("file_blocked").size(), set.file_blocked.size());
    EXPECT_EQ(payload.at("path_blocked")[0].at("category"), "path-traversal");
}

TEST(ReportWriterTest, MapsVerdictsToExitCodes) {
    EXPECT_EQ(warden::report::exit_code_for(SecurityAction::Allow), 0);
    EXPECT_EQ(warden::report::exit_code_for(SecurityAction::Deny), 1);
    EXPECT_EQ(warden::report::exit_code_for(SecurityAction::Ask), 4);
    EXPECT_EQ(warden::report::most_severe(SecurityAction::Ask, SecurityAction::Deny),
              SecurityAction::Deny);
    EXPECT_EQ(warden::report::most_severe(SecurityAction::Ask, SecurityAction::Allow),
              SecurityAction::Ask);
}

}  // namespace
