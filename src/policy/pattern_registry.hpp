#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "core/errors/warden_errors.hpp"

namespace re2 {
class RE2;
}

namespace warden::policy {

enum class RegistryKind {
    CommandDeny,
    CommandWarn,
    CommandAllow,  // user exemptions from CommandWarn, never from CommandDeny
    FileBlocked,
    PathBlocked
};

enum class MatchKind {
    Regex,
    Literal,
    Glob
};

std::string to_string(RegistryKind kind);
std::string to_string(MatchKind kind);

struct PatternDefinition {
    std::string pattern;
    std::string category;
    MatchKind kind = MatchKind::Regex;
};

// One compiled matcher. Matching is case-insensitive and runs in time linear
// in the subject: regexes and globs go through RE2, literals through find().
class ValidationPattern {
public:
    static core::errors::Result<ValidationPattern> compile(
        const PatternDefinition& definition, RegistryKind registry);

    bool matches(std::string_view subject, std::string_view folded_subject) const;

    const std::string& source() const { return definition_.pattern; }
    const std::string& category() const { return definition_.category; }
    MatchKind kind() const { return definition_.kind; }

private:
    ValidationPattern(PatternDefinition definition,
                      std::shared_ptr<const re2::RE2> regex,
                      std::string folded_literal);

    PatternDefinition definition_;
    std::shared_ptr<const re2::RE2> regex_;
    std::string folded_literal_;
};

// Ordered, immutable list of matchers. first_match() scans in list order.
class PatternRegistry {
public:
    static core::errors::Result<PatternRegistry> compile(
        RegistryKind kind, const std::vector<PatternDefinition>& definitions);

    const ValidationPattern* first_match(std::string_view subject) const;

    RegistryKind kind() const { return kind_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<ValidationPattern>& entries() const { return entries_; }

private:
    PatternRegistry(RegistryKind kind, std::vector<ValidationPattern> entries);

    RegistryKind kind_;
    std::vector<ValidationPattern> entries_;
    bool has_literals_ = false;
};

// Caller-supplied additions, already parsed from whatever config format the
// caller uses. Command entries are RE2 expressions, file entries are globs,
// path entries are literal fragments.
struct PatternConfig {
    std::vector<std::string> blocked_commands;
    std::vector<std::string> warning_commands;
    std::vector<std::string> allowed_commands;
    std::vector<std::string> blocked_files;
    std::vector<std::string> blocked_paths;
};

struct PatternSet {
    PatternRegistry command_deny;
    PatternRegistry command_warn;
    PatternRegistry command_allow;
    PatternRegistry file_blocked;
    PatternRegistry path_blocked;
};

// The built-in table for a registry. CommandAllow has no built-ins.
const std::vector<PatternDefinition>& builtin_definitions(RegistryKind kind);

std::string glob_to_regex(std::string_view glob);

core::errors::Result<std::shared_ptr<const PatternSet>> build_pattern_set(
    const PatternConfig& config = PatternConfig{});

}  // namespace warden::policy
