#pragma once

#include <memory>
#include <string>
#include <string_view>
#include "policy/pattern_registry.hpp"
#include "protocol/validation_contract.hpp"
#include "stats/validation_stats.hpp"

namespace warden::policy {

class FileValidator {
public:
    FileValidator(std::shared_ptr<const PatternSet> patterns,
                  std::shared_ptr<stats::ValidationStats> stats);

    protocol::ValidationResult validate(std::string_view path) const;

    // Backslashes become '/', runs of '/' collapse and "." segments go away.
    // ".." is kept so traversal stays visible to the path registry.
    static std::string canonical_separators(std::string_view path);
    static std::string_view file_name(std::string_view canonical_path);

private:
    protocol::ValidationResult decide(std::string_view path) const;

    std::shared_ptr<const PatternSet> patterns_;
    std::shared_ptr<stats::ValidationStats> stats_;
};

}  // namespace warden::policy
