#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace warden::protocol {

    enum class CliCommand {
        CheckCommand,
        CheckFile,
        CheckTool,
        Batch,
        ListPatterns
    };

    // Validated user input for one warden_cli invocation
    struct CliRequest {
        CliCommand command = CliCommand::CheckCommand;
        std::optional<std::string> command_text;    // check-command
        std::optional<std::string> path;            // check-file
        std::optional<std::string> tool_name;       // check-tool
        std::string tool_input = "{}";              // check-tool, raw JSON
        std::optional<std::filesystem::path> config_file;
        bool verbose = false;
        bool print_stats = false;
    };

    inline std::string to_string(const CliCommand command) {
        switch (command) {
            case CliCommand::CheckCommand: return "check-command";
            case CliCommand::CheckFile:    return "check-file";
            case CliCommand::CheckTool:    return "check-tool";
            case CliCommand::Batch:        return "batch";
            case CliCommand::ListPatterns: return "list-patterns";
            default: return "unknown";
        }
    }

} // namespace warden::protocol
