#pragma once

#include <memory>
#include <string_view>
#include "policy/normalizer.hpp"
#include "policy/pattern_registry.hpp"
#include "protocol/validation_contract.hpp"
#include "stats/validation_stats.hpp"

namespace warden::policy {

// Normalizes a command, then walks deny -> warn (with allow exemptions) ->
// allow. Stateless apart from the shared stats counters, so one instance may
// serve any number of threads.
class CommandValidator {
public:
    CommandValidator(std::shared_ptr<const PatternSet> patterns,
                     std::shared_ptr<stats::ValidationStats> stats,
                     Normalizer normalizer = Normalizer{});

    protocol::ValidationResult validate(std::string_view command) const;

private:
    protocol::ValidationResult decide(std::string_view command,
                                      bool& obfuscated) const;

    std::shared_ptr<const PatternSet> patterns_;
    std::shared_ptr<stats::ValidationStats> stats_;
    Normalizer normalizer_;
};

}  // namespace warden::policy
