#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/batch_runner.hpp"
#include "core/errors/warden_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using nlohmann::json;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::policy::PolicyGuard;
using warden::protocol::SecurityAction;
using warden::tools::ToolInputRouter;

std::vector<json> read_lines(const std::string& text) {
    std::vector<json> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(json::parse(line));
    }
    return lines;
}

ToolInputRouter make_router() {
    auto created = PolicyGuard::create();
    EXPECT_FALSE(is_error(created));
    return ToolInputRouter(get_value(created));
}

TEST(BatchRunnerTest, WritesOneResultPerCallThenStats) {
    const auto router = make_router();
    std::istringstream in(
        R"({"id": "a", "tool": "Bash", "input": {"command": "rm -rf /"}})" "\n"
        "\n"
        R"({"id": 7, "tool": "Read", "input": {"file_path": "src/main.cpp"}})" "\n"
        R"({"id": "c", "tool": "Bash", "input": "git push --force"})" "\n");
    std::ostringstream out;

    const auto summary = warden::app::run_batch(in, out, router);
    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(summary.malformed, 0u);
    EXPECT_EQ(summary.most_severe, SecurityAction::Deny);

    const auto lines = read_lines(out.str());
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].at("id"), "a");
    EXPECT_EQ(lines[0].at("action"), "deny");
    EXPECT_EQ(lines[1].at("id"), 7);
    EXPECT_EQ(lines[1].at("action"), "allow");
    EXPECT_EQ(lines[2].at("action"), "ask");
    EXPECT_EQ(lines[3].at("stats").at("commands_validated"), 2);
    EXPECT_EQ(lines[3].at("stats").at("files_validated"), 1);
}

TEST(BatchRunnerTest, DeniesUnreadableLinesAndContinues) {
    const auto router = make_router();
    std::istringstream in(
        "not json\n"
        R"({"id": "x", "input": {}})" "\n"
        R"({"id": "y", "tool": "Bash", "input": {"command": "ls"}})" "\n");
    std::ostringstream out;

    const auto summary = warden::app::run_batch(in, out, router);
    EXPECT_EQ(summary.processed, 3u);
    EXPECT_EQ(summary.malformed, 2u);

    const auto lines = read_lines(out.str());
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_TRUE(lines[0].at("id").is_null());
    EXPECT_EQ(lines[0].at("action"), "deny");
    EXPECT_EQ(lines[1].at("id"), "x");
    EXPECT_EQ(lines[1].at("matched_pattern"), "malformed-input");
    EXPECT_EQ(lines[2].at("action"), "allow");
}

TEST(BatchRunnerTest, EmptyInputStillReportsStats) {
    const auto router = make_router();
    std::istringstream in("");
    std::ostringstream out;

    const auto summary = warden::app::run_batch(in, out, router);
    EXPECT_EQ(summary.processed, 0u);
    EXPECT_EQ(summary.most_severe, SecurityAction::Allow);

    const auto lines = read_lines(out.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(lines[0].contains("stats"));
}

}  // namespace
