#pragma once

#include <memory>
#include <string_view>
#include "core/errors/warden_errors.hpp"
#include "policy/command_validator.hpp"
#include "policy/file_validator.hpp"
#include "policy/pattern_registry.hpp"
#include "protocol/validation_contract.hpp"
#include "stats/validation_stats.hpp"

namespace warden::policy {

// Entry point for callers. Copies share the compiled registries and the
// stats counters, so a guard can be handed to worker threads by value.
class PolicyGuard {
public:
    static core::errors::Result<PolicyGuard> create(
        const PatternConfig& config = PatternConfig{});

    protocol::ValidationResult validate_command(std::string_view command) const;
    protocol::ValidationResult validate_file(std::string_view path) const;

    bool is_blocked(std::string_view command) const;
    bool requires_confirmation(std::string_view command) const;
    bool is_file_blocked(std::string_view path) const;

    stats::ValidationStatsSnapshot stats_snapshot() const;
    void reset_stats() const;

    const PatternSet& patterns() const { return *patterns_; }

private:
    PolicyGuard(std::shared_ptr<const PatternSet> patterns,
                std::shared_ptr<stats::ValidationStats> stats);

    std::shared_ptr<const PatternSet> patterns_;
    std::shared_ptr<stats::ValidationStats> stats_;
    CommandValidator commands_;
    FileValidator files_;
};

}  // namespace warden::policy
