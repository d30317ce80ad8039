#pragma once

#include <optional>
#include <string>
#include <utility>

namespace warden::protocol {

enum class SecurityAction {
    Allow,
    Deny,
    Ask
};

// Outcome of a single command or file validation.
// reason and matched_pattern are set exactly when action != Allow.
struct ValidationResult {
    SecurityAction action = SecurityAction::Allow;
    std::optional<std::string> reason;
    std::optional<std::string> matched_pattern;
    std::optional<std::string> category;
    std::optional<std::string> normalized_command;
};

inline ValidationResult make_allow() {
    return ValidationResult{};
}

inline ValidationResult make_verdict(const SecurityAction action, std::string reason,
                                     std::string matched_pattern,
                                     std::optional<std::string> category = std::nullopt) {
    ValidationResult result;
    result.action = action;
    result.reason = std::move(reason);
    result.matched_pattern = std::move(matched_pattern);
    result.category = std::move(category);
    return result;
}

inline std::string to_string(const SecurityAction action) {
    switch (action) {
        case SecurityAction::Allow:
            return "allow";
        case SecurityAction::Deny:
            return "deny";
        case SecurityAction::Ask:
            return "ask";
        default:
            return "unknown";
    }
}

}  // namespace warden::protocol
