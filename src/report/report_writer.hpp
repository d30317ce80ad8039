#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/warden_errors.hpp"
#include "policy/pattern_registry.hpp"
#include "protocol/validation_contract.hpp"
#include "stats/validation_stats.hpp"

namespace warden::report {

// Optional fields of the result are omitted rather than written as null.
nlohmann::json result_to_json(const protocol::ValidationResult& result);

nlohmann::json stats_to_json(const stats::ValidationStatsSnapshot& snapshot);

nlohmann::json error_to_json(const core::errors::WardenError& error);

nlohmann::json registry_to_json(const policy::PatternRegistry& registry);
nlohmann::json pattern_set_to_json(const policy::PatternSet& patterns);

// Process exit status for a verdict: 0 allow, 1 deny, 4 ask.
int exit_code_for(protocol::SecurityAction action);

// Deny outranks ask, ask outranks allow.
protocol::SecurityAction most_severe(protocol::SecurityAction lhs,
                                     protocol::SecurityAction rhs);

}  // namespace warden::report
