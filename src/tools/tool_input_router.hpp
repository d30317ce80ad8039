#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "policy/policy_guard.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/validation_contract.hpp"

namespace warden::tools {

enum class ToolKind {
    Command,  // bash, shell, exec
    File,     // read, write, edit, multiedit, glob, grep, notebookedit
    Unguarded
};

std::string to_string(ToolKind kind);

// Maps an agent tool call onto the command or file validator.
class ToolInputRouter {
public:
    explicit ToolInputRouter(policy::PolicyGuard guard);

    protocol::ValidationResult route(std::string_view tool_name,
                                     const nlohmann::json& input) const;

    // Same as above, with the arguments still as raw JSON text. Unparseable
    // arguments of a guarded tool are denied.
    protocol::ValidationResult route(const protocol::ToolCall& call) const;

    static ToolKind classify(std::string_view tool_name);
    static std::optional<std::string> extract_command(const nlohmann::json& input);
    static std::optional<std::string> extract_file_path(const nlohmann::json& input);

    const policy::PolicyGuard& guard() const { return guard_; }

private:
    policy::PolicyGuard guard_;
};

}  // namespace warden::tools
