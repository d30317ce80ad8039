#include "cli_parser.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden::app::cli {

    using namespace warden::core::errors;
    using warden::protocol::CliCommand;
    using warden::protocol::CliRequest;

    namespace {

        constexpr const char* kUsage =
            "Usage: warden_cli <check-command|check-file|check-tool|batch|list-patterns> "
            "[--command TEXT] [--path PATH] [--tool NAME --input JSON] "
            "[--config FILE] [--verbose] [--stats]";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> command_text;
            std::optional<std::string> path;
            std::optional<std::string> tool;
            std::optional<std::string> input;
            std::optional<std::string> config;
            bool verbose = false;
            bool stats = false;
        };

        std::optional<CliCommand> command_from_string(const std::string& name) {
            if (name == "check-command") return CliCommand::CheckCommand;
            if (name == "check-file") return CliCommand::CheckFile;
            if (name == "check-tool") return CliCommand::CheckTool;
            if (name == "batch") return CliCommand::Batch;
            if (name == "list-patterns") return CliCommand::ListPatterns;
            return std::nullopt;
        }

        WardenError flag_not_allowed(const std::string& flag, CliCommand command) {
            return WardenError{ErrorCategory::Input,
                               flag + " is not valid for " + protocol::to_string(command),
                               "conflicting_flags", kUsage};
        }

    } // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return WardenError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string name = argv[1];
        const auto command = command_from_string(name);
        if (!command) {
            return WardenError{ErrorCategory::Input, "Unknown command: " + name, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued = {
            {"--command", &raw.command_text},
            {"--path", &raw.path},
            {"--tool", &raw.tool},
            {"--input", &raw.input},
            {"--config", &raw.config},
        };
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }
            if (args[i] == "--stats") {
                raw.stats = true;
                continue;
            }

            bool matched = false;
            for (const auto& flag : valued) {
                if (args[i] != flag.first) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return WardenError{ErrorCategory::Input, "Missing value for " + flag.first, "missing_value"};
                }
                *flag.second = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return WardenError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        // 3. Validator Phase: every command takes exactly the flags it needs
        CliRequest req;
        req.command = *command;
        req.verbose = raw.verbose;
        req.print_stats = raw.stats;

        if (raw.config) {
            if (raw.config->empty()) {
                return WardenError{ErrorCategory::Input, "--config cannot be empty", "missing_value"};
            }
            req.config_file = std::filesystem::path(raw.config.value());
        }

        if (req.command != CliCommand::CheckCommand && raw.command_text) return flag_not_allowed("--command", req.command);
        if (req.command != CliCommand::CheckFile && raw.path) return flag_not_allowed("--path", req.command);
        if (req.command != CliCommand::CheckTool && raw.tool) return flag_not_allowed("--tool", req.command);
        if (req.command != CliCommand::CheckTool && raw.input) return flag_not_allowed("--input", req.command);

        switch (req.command) {
            case CliCommand::CheckCommand:
                if (!raw.command_text) {
                    return WardenError{ErrorCategory::Input, "check-command requires --command", "missing_required_flag"};
                }
                req.command_text = raw.command_text.value();
                break;
            case CliCommand::CheckFile:
                if (!raw.path) {
                    return WardenError{ErrorCategory::Input, "check-file requires --path", "missing_required_flag"};
                }
                req.path = raw.path.value();
                break;
            case CliCommand::CheckTool:
                if (!raw.tool || raw.tool->empty()) {
                    return WardenError{ErrorCategory::Input, "check-tool requires --tool", "missing_required_flag"};
                }
                req.tool_name = raw.tool.value();
                if (raw.input) req.tool_input = raw.input.value();
                break;
            case CliCommand::Batch:
            case CliCommand::ListPatterns:
                if (raw.stats && req.command == CliCommand::ListPatterns) {
                    return flag_not_allowed("--stats", req.command);
                }
                break;
        }

        return req;
    }

} // namespace warden::app::cli
