#include "policy/command_validator.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/log_sanitizer.hpp"
#include "policy/text_checks.hpp"

namespace warden::policy {

using protocol::SecurityAction;
using protocol::ValidationResult;

namespace {

constexpr const char* kInternalErrorReason =
    "Validation error - command denied for safety";

std::string describe(const std::set<Transformation>& transformations) {
    std::string joined;
    for (const Transformation t : transformations) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += to_string(t);
    }
    return joined;
}

}  // namespace

CommandValidator::CommandValidator(std::shared_ptr<const PatternSet> patterns,
                                   std::shared_ptr<stats::ValidationStats> stats,
                                   Normalizer normalizer)
    : patterns_(std::move(patterns)),
      stats_(std::move(stats)),
      normalizer_(normalizer) {}

ValidationResult CommandValidator::validate(std::string_view command) const {
    const auto started = std::chrono::steady_clock::now();
    bool obfuscated = false;
    ValidationResult result;
    try {
        result = decide(command, obfuscated);
        WARDEN_LOG_DEBUG("CommandValidator: " + protocol::to_string(result.action) +
                         " for " + sanitize_command_for_logging(command));
    } catch (const std::exception& ex) {
        WARDEN_LOG_ERROR("CommandValidator: " +
                         sanitize_log_output(ex.what()));
        result = protocol::make_verdict(SecurityAction::Deny, kInternalErrorReason,
                                        "internal-error", "internal-error");
    }

    if (stats_ != nullptr) {
        stats_->record_command(result.action, obfuscated,
                               std::chrono::steady_clock::now() - started);
    }
    return result;
}

ValidationResult CommandValidator::decide(std::string_view command,
                                          bool& obfuscated) const {
    if (auto malformed = malformed_reason(command, "Command")) {
        return protocol::make_verdict(SecurityAction::Deny, std::move(*malformed),
                                      "malformed-input", "malformed-input");
    }

    NormalizationResult normalized = normalizer_.normalize(command);
    obfuscated = normalized.obfuscated();
    if (obfuscated) {
        WARDEN_LOG_WARN("CommandValidator: obfuscation detected (" +
                        describe(normalized.transformations) + "): " +
                        sanitize_command_for_logging(normalized.normalized));
    }

    const std::string& subject = normalized.normalized;
    ValidationResult result;
    if (const auto* denied = patterns_->command_deny.first_match(subject)) {
        result = protocol::make_verdict(
            SecurityAction::Deny,
            "Command matches blocked security pattern (" + denied->category() + ")",
            denied->source(), denied->category());
    } else if (const auto* warned = patterns_->command_warn.first_match(subject)) {
        const auto* exempt = patterns_->command_allow.first_match(subject);
        if (exempt == nullptr) {
            result = protocol::make_verdict(
                SecurityAction::Ask,
                "Command requires confirmation (" + warned->category() + ")",
                warned->source(), warned->category());
        } else {
            WARDEN_LOG_DEBUG("CommandValidator: warning " + warned->category() +
                             " exempted by " + sanitize_log_output(exempt->source()));
        }
    }

    // Text that never settled may still hide something the registries missed.
    if (result.action == SecurityAction::Allow && normalized.decode_limit_reached) {
        result = protocol::make_verdict(
            SecurityAction::Ask,
            "Command contains unresolved obfuscation; decoding stopped at its bound",
            "decode-pass-limit", "unresolved-obfuscation");
    }

    result.normalized_command = std::move(normalized.normalized);
    return result;
}

}  // namespace warden::policy
