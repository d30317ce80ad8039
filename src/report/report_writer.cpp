#include "report/report_writer.hpp"

#include <initializer_list>
#include <optional>
#include <string>

namespace warden::report {

using nlohmann::json;
using protocol::SecurityAction;

namespace {

void put_if_present(json& target, const char* key, const std::optional<std::string>& value) {
    if (value.has_value()) {
        target[key] = value.value();
    }
}

int severity(const SecurityAction action) {
    switch (action) {
        case SecurityAction::Deny:
            return 2;
        case SecurityAction::Ask:
            return 1;
        case SecurityAction::Allow:
        default:
            return 0;
    }
}

}  // namespace

json result_to_json(const protocol::ValidationResult& result) {
    json payload;
    payload["action"] = protocol::to_string(result.action);
    put_if_present(payload, "reason", result.reason);
    put_if_present(payload, "matched_pattern", result.matched_pattern);
    put_if_present(payload, "category", result.category);
    put_if_present(payload, "normalized_command", result.normalized_command);
    return payload;
}

json stats_to_json(const stats::ValidationStatsSnapshot& snapshot) {
    json payload;
    payload["commands_validated"] = snapshot.commands_validated;
    payload["commands_blocked"] = snapshot.commands_blocked;
    payload["commands_warned"] = snapshot.commands_warned;
    payload["files_validated"] = snapshot.files_validated;
    payload["files_blocked"] = snapshot.files_blocked;
    payload["obfuscation_detected"] = snapshot.obfuscation_detected;
    payload["avg_validation_time_ms"] = snapshot.avg_validation_time_ms;
    return payload;
}

json error_to_json(const core::errors::WardenError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return json{{"error", payload}};
}

json registry_to_json(const policy::PatternRegistry& registry) {
    json entries = json::array();
    for (const auto& entry : registry.entries()) {
        entries.push_back(json{{"pattern", entry.source()},
                               {"category", entry.category()},
                               {"kind", policy::to_string(entry.kind())}});
    }
    return entries;
}

json pattern_set_to_json(const policy::PatternSet& patterns) {
    json payload;
    for (const policy::PatternRegistry* registry :
         {&patterns.command_deny, &patterns.command_warn, &patterns.command_allow,
          &patterns.file_blocked, &patterns.path_blocked}) {
        payload[policy::to_string(registry->kind())] = registry_to_json(*registry);
    }
    return payload;
}

int exit_code_for(const SecurityAction action) {
    switch (action) {
        case SecurityAction::Deny:
            return 1;
        case SecurityAction::Ask:
            return 4;
        case SecurityAction::Allow:
        default:
            return 0;
    }
}

SecurityAction most_severe(const SecurityAction lhs, const SecurityAction rhs) {
    return severity(lhs) >= severity(rhs) ? lhs : rhs;
}

}  // namespace warden::report
