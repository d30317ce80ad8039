#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/batch_runner.hpp"
#include "app/cli_parser.hpp"
#include "core/config/security_config.hpp"
#include "core/errors/warden_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/cli_request.hpp"
#include "protocol/tool_contract.hpp"
#include "report/report_writer.hpp"
#include "tools/tool_input_router.hpp"

namespace {

constexpr int kExitUsage = 2;
constexpr int kExitConfig = 3;

void report_error(const warden::core::errors::WardenError& err, const std::string& context) {
    WARDEN_LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        WARDEN_LOG_INFO("Hint: " + err.hint);
    }
    std::cout << warden::report::error_to_json(err).dump() << std::endl;
}

void print_verdict(const warden::protocol::ValidationResult& result,
                   const warden::policy::PolicyGuard& guard, const bool with_stats) {
    nlohmann::json report = warden::report::result_to_json(result);
    if (with_stats) {
        report["stats"] = warden::report::stats_to_json(guard.stats_snapshot());
    }
    std::cout << report.dump() << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    using warden::protocol::CliCommand;

    // 1. Parse CLI input and return normalized input errors
    auto parsed = warden::app::cli::parse_and_validate(argc, argv);
    if (warden::core::errors::is_error(parsed)) {
        report_error(warden::core::errors::get_error(parsed), "Input error");
        return kExitUsage;
    }
    const auto& req = warden::core::errors::get_value(parsed);
    if (req.verbose) {
        warden::core::logging::Logger::get().set_min_level(
            warden::core::logging::LogLevel::DEBUG);
    }
    WARDEN_LOG_DEBUG("warden_cli: " + warden::protocol::to_string(req.command));

    // 2. Load user patterns on top of the built-in tables
    warden::policy::PatternConfig pattern_config;
    if (req.config_file) {
        auto loaded = warden::core::config::load_security_config(*req.config_file);
        if (warden::core::errors::is_error(loaded)) {
            report_error(warden::core::errors::get_error(loaded), "Configuration error");
            return kExitConfig;
        }
        pattern_config = warden::core::errors::get_value(loaded);
    }

    auto created = warden::policy::PolicyGuard::create(pattern_config);
    if (warden::core::errors::is_error(created)) {
        report_error(warden::core::errors::get_error(created), "Configuration error");
        return kExitConfig;
    }
    const auto& guard = warden::core::errors::get_value(created);

    // 3. Dispatch
    switch (req.command) {
        case CliCommand::CheckCommand: {
            const auto result = guard.validate_command(req.command_text.value());
            print_verdict(result, guard, req.print_stats);
            return warden::report::exit_code_for(result.action);
        }
        case CliCommand::CheckFile: {
            const auto result = guard.validate_file(req.path.value());
            print_verdict(result, guard, req.print_stats);
            return warden::report::exit_code_for(result.action);
        }
        case CliCommand::CheckTool: {
            const warden::tools::ToolInputRouter router(guard);
            const auto result = router.route(
                warden::protocol::ToolCall{"cli", req.tool_name.value(), req.tool_input});
            print_verdict(result, guard, req.print_stats);
            return warden::report::exit_code_for(result.action);
        }
        case CliCommand::Batch: {
            const warden::tools::ToolInputRouter router(guard);
            const auto summary = warden::app::run_batch(std::cin, std::cout, router);
            WARDEN_LOG_INFO("Batch: " + std::to_string(summary.processed) + " calls, " +
                            std::to_string(summary.malformed) + " malformed");
            return warden::report::exit_code_for(summary.most_severe);
        }
        case CliCommand::ListPatterns:
            std::cout << warden::report::pattern_set_to_json(guard.patterns()).dump(2)
                      << std::endl;
            return 0;
    }
    return kExitUsage;
}
