#include "tools/tool_input_router.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/log_sanitizer.hpp"

namespace warden::tools {

using protocol::SecurityAction;
using protocol::ValidationResult;

namespace {

constexpr std::array<const char*, 3> kCommandTools = {"bash", "shell", "exec"};
constexpr std::array<const char*, 7> kFileTools = {
    "read", "write", "edit", "multiedit", "glob", "grep", "notebookedit"};

constexpr std::array<const char*, 3> kCommandFields = {"command", "cmd", "script"};
constexpr std::array<const char*, 10> kPathFields = {
    "file_path", "filePath", "notebook_path", "notebookPath", "path",
    "pattern",   "source",   "destination",   "src",          "dest"};

constexpr std::string_view kFileScheme = "file://";

std::string lowercase(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return lowered;
}

template <std::size_t N>
std::optional<std::string> first_string_field(const nlohmann::json& input,
                                              const std::array<const char*, N>& fields) {
    if (input.is_string()) {
        return input.get<std::string>();
    }
    if (!input.is_object()) {
        return std::nullopt;
    }
    for (const char* field : fields) {
        const auto it = input.find(field);
        if (it != input.end() && it->is_string()) {
            return it->template get<std::string>();
        }
    }
    return std::nullopt;
}

ValidationResult missing_argument(const ToolKind kind) {
    const bool command = kind == ToolKind::Command;
    return protocol::make_verdict(
        SecurityAction::Deny,
        command ? "Tool input has no command to validate"
                : "Tool input has no file path to validate",
        "malformed-input", "malformed-input");
}

}  // namespace

std::string to_string(const ToolKind kind) {
    switch (kind) {
        case ToolKind::Command:
            return "command";
        case ToolKind::File:
            return "file";
        case ToolKind::Unguarded:
            return "unguarded";
        default:
            return "unknown";
    }
}

ToolInputRouter::ToolInputRouter(policy::PolicyGuard guard) : guard_(std::move(guard)) {}

ToolKind ToolInputRouter::classify(std::string_view tool_name) {
    const std::string lowered = lowercase(tool_name);
    for (const char* name : kCommandTools) {
        if (lowered == name) {
            return ToolKind::Command;
        }
    }
    for (const char* name : kFileTools) {
        if (lowered == name) {
            return ToolKind::File;
        }
    }
    return ToolKind::Unguarded;
}

std::optional<std::string> ToolInputRouter::extract_command(const nlohmann::json& input) {
    return first_string_field(input, kCommandFields);
}

std::optional<std::string> ToolInputRouter::extract_file_path(const nlohmann::json& input) {
    if (auto path = first_string_field(input, kPathFields)) {
        return path;
    }
    if (input.is_object()) {
        const auto it = input.find("url");
        if (it != input.end() && it->is_string()) {
            const std::string url = it->get<std::string>();
            if (url.compare(0, kFileScheme.size(), kFileScheme) == 0) {
                return url.substr(kFileScheme.size());
            }
        }
    }
    return std::nullopt;
}

ValidationResult ToolInputRouter::route(std::string_view tool_name,
                                        const nlohmann::json& input) const {
    const ToolKind kind = classify(tool_name);
    switch (kind) {
        case ToolKind::Command: {
            const auto command = extract_command(input);
            if (!command) {
                WARDEN_LOG_WARN("ToolInputRouter: no command in input for tool " +
                                policy::sanitize_log_output(tool_name, 64));
                return missing_argument(kind);
            }
            return guard_.validate_command(*command);
        }
        case ToolKind::File: {
            const auto path = extract_file_path(input);
            if (!path) {
                WARDEN_LOG_WARN("ToolInputRouter: no file path in input for tool " +
                                policy::sanitize_log_output(tool_name, 64));
                return missing_argument(kind);
            }
            return guard_.validate_file(*path);
        }
        case ToolKind::Unguarded:
        default:
            return protocol::make_allow();
    }
}

ValidationResult ToolInputRouter::route(const protocol::ToolCall& call) const {
    const ToolKind kind = classify(call.name);
    if (kind == ToolKind::Unguarded) {
        return protocol::make_allow();
    }

    const nlohmann::json input = nlohmann::json::parse(call.arguments, nullptr, false);
    if (input.is_discarded()) {
        WARDEN_LOG_WARN("ToolInputRouter: unparseable arguments for call " +
                        policy::sanitize_log_output(call.id, 64));
        return protocol::make_verdict(SecurityAction::Deny,
                                      "Tool arguments are not valid JSON",
                                      "malformed-input", "malformed-input");
    }
    return route(call.name, input);
}

}  // namespace warden::tools
