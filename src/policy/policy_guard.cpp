#include "policy/policy_guard.hpp"

#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace warden::policy {

using protocol::SecurityAction;

PolicyGuard::PolicyGuard(std::shared_ptr<const PatternSet> patterns,
                         std::shared_ptr<stats::ValidationStats> stats)
    : patterns_(std::move(patterns)),
      stats_(std::move(stats)),
      commands_(patterns_, stats_),
      files_(patterns_, stats_) {}

core::errors::Result<PolicyGuard> PolicyGuard::create(const PatternConfig& config) {
    auto patterns = build_pattern_set(config);
    if (core::errors::is_error(patterns)) {
        const auto& error = core::errors::get_error(patterns);
        WARDEN_LOG_ERROR("PolicyGuard: " + error.message);
        return error;
    }

    auto set = std::move(core::errors::get_value(patterns));
    WARDEN_LOG_DEBUG("PolicyGuard: loaded " +
                     std::to_string(set->command_deny.size()) + " deny, " +
                     std::to_string(set->command_warn.size()) + " warn, " +
                     std::to_string(set->command_allow.size()) + " allow, " +
                     std::to_string(set->file_blocked.size()) + " file and " +
                     std::to_string(set->path_blocked.size()) + " path patterns");
    return PolicyGuard(std::move(set), std::make_shared<stats::ValidationStats>());
}

protocol::ValidationResult PolicyGuard::validate_command(std::string_view command) const {
    return commands_.validate(command);
}

protocol::ValidationResult PolicyGuard::validate_file(std::string_view path) const {
    return files_.validate(path);
}

bool PolicyGuard::is_blocked(std::string_view command) const {
    return validate_command(command).action == SecurityAction::Deny;
}

bool PolicyGuard::requires_confirmation(std::string_view command) const {
    return validate_command(command).action == SecurityAction::Ask;
}

bool PolicyGuard::is_file_blocked(std::string_view path) const {
    return validate_file(path).action == SecurityAction::Deny;
}

stats::ValidationStatsSnapshot PolicyGuard::stats_snapshot() const {
    return stats_->snapshot();
}

void PolicyGuard::reset_stats() const {
    stats_->reset();
}

}  // namespace warden::policy
