#include "policy/pattern_registry.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>
#include <re2/re2.h>

namespace warden::policy {

using core::errors::ErrorCategory;
using core::errors::WardenError;

namespace {

std::string fold_ascii(std::string_view value) {
    std::string folded(value);
    std::transform(folded.begin(), folded.end(), folded.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return folded;
}

std::string_view trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n\f\v");
    return value.substr(first, last - first + 1);
}

re2::StringPiece piece(std::string_view value) {
    return re2::StringPiece(value.data(), value.size());
}

std::vector<PatternDefinition> user_definitions(const std::vector<std::string>& patterns,
                                                const std::string& category,
                                                const MatchKind kind) {
    std::vector<PatternDefinition> definitions;
    definitions.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        definitions.push_back(PatternDefinition{pattern, category, kind});
    }
    return definitions;
}

std::vector<PatternDefinition> with_builtins(const RegistryKind kind,
                                             std::vector<PatternDefinition> extra) {
    std::vector<PatternDefinition> merged = builtin_definitions(kind);
    merged.insert(merged.end(), std::make_move_iterator(extra.begin()),
                  std::make_move_iterator(extra.end()));
    return merged;
}

// Commands that must never run. Scanned before the warning table.
const std::vector<PatternDefinition> kCommandDenyDefinitions = {
    // Recursive deletion of /, ~ or everything in the current directory. The
    // recursive flag may sit in any flag cluster.
    {R"(\brm\s+(-\S*\s+)*(-[a-zA-Z]*r[a-zA-Z]*|--recursive)\s+(-\S*\s+)*/\*?($|\s|;))",
     "destructive-delete"},
    {R"(\brm\s+(-\S*\s+)*(-[a-zA-Z]*r[a-zA-Z]*|--recursive)\s+(-\S*\s+)*~/?\*?($|\s|;))",
     "destructive-delete"},
    {R"(\brm\s+(-\S*\s+)*(-[a-zA-Z]*r[a-zA-Z]*|--recursive)\s+(-\S*\s+)*\*($|\s|;))",
     "destructive-delete"},
    {"--no-preserve-root", "destructive-delete", MatchKind::Literal},

    {R"(\bmkfs\b)", "filesystem-destruction"},
    {R"(\bdd\s+.*if=/dev/(zero|random|urandom)\b)", "filesystem-destruction"},
    {R"(\bdd\s+.*of=/dev/(sd[a-z]|hd[a-z]|xvd[a-z]|nvme|mmcblk))", "filesystem-destruction"},

    {R"(:\(\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;?\s*:)", "fork-bomb"},
    {R"(\b\w+\(\)\s*\{\s*\w+\s*\|\s*\w+\s*&\s*\})", "fork-bomb"},
    {R"(\bwhile\s*(\(\s*true\s*\)|true|:).*\bfork\b)", "fork-bomb"},

    {R"(\bcurl\s+.*\|\s*(sudo\s+)?(ba|z|da)?sh\b)", "remote-code-execution"},
    {R"(\bwget\s+.*\|\s*(sudo\s+)?(ba|z|da)?sh\b)", "remote-code-execution"},
    {R"(\bcurl\s+.*\|\s*(sudo\s+)?python[0-9.]*\b)", "remote-code-execution"},
    {R"(\bwget\s+.*\|\s*(sudo\s+)?python[0-9.]*\b)", "remote-code-execution"},
    {R"(\bcurl\s+.*>\s*\S*\.sh\s*&&)", "remote-code-execution"},

    {R"(\bsudo\s+su\s*(-|$))", "privilege-escalation"},
    {R"(\bsudo\s+-i($|\s))", "privilege-escalation"},
    {R"(\bsudo\s+passwd\s+root\b)", "privilege-escalation"},

    {R"(\bchmod\s+(-[a-zA-Z]*\s+)*777\s+~?/)", "dangerous-permissions"},
    {R"(\bchmod\s+(-[a-zA-Z]*\s+)*(u\+s|g\+s|[2-7][0-7]{3})\b)", "dangerous-permissions"},
    {R"(\bchown\s+(-[a-zA-Z]*\s+)*root[:\s])", "dangerous-permissions"},

    {R"(>\s*/etc/passwd\b)", "system-file-overwrite"},
    {R"(>\s*/etc/shadow\b)", "system-file-overwrite"},
    {R"(>\s*/etc/sudoers\b)", "system-file-overwrite"},

    {R"(\biptables\s+-F\b)", "firewall-tampering"},
    {R"(\bufw\s+disable\b)", "firewall-tampering"},

    {R"(\bhistory\s+-c\b)", "history-tampering"},
    {R"(>\s*~/\.bash_history\b)", "history-tampering"},
    {R"(\bexport\s+HISTSIZE=0\b)", "history-tampering"},

    {R"(\binsmod\b)", "kernel-tampering"},
    {R"(\bmodprobe\s+)", "kernel-tampering"},
    {R"(\becho\s+.*>\s*/proc/)", "kernel-tampering"},
    {R"(\becho\s+.*>\s*/sys/)", "kernel-tampering"},
};

// Commands that run, but only with a visible warning attached.
const std::vector<PatternDefinition> kCommandWarnDefinitions = {
    {R"(\bsudo\b)", "elevated-privileges"},
    {R"(\bsu(\s+-)?\s*$)", "elevated-privileges"},
    {R"(\bdoas\b)", "elevated-privileges"},

    {R"(\bchmod\b)", "permission-change"},
    {R"(\bchown\b)", "permission-change"},
    {R"(\bchgrp\b)", "permission-change"},

    {R"(\bgit\s+push\b.*\s--force)", "git-destructive"},
    {R"(\bgit\s+push\b.*\s-f\b)", "git-destructive"},
    {R"(\bgit\s+reset\s+--hard\b)", "git-destructive"},
    {R"(\bgit\s+clean\s+-[a-z]*f)", "git-destructive"},
    {R"(\bgit\s+checkout\s+--\s+\.)", "git-destructive"},

    {R"(\bnpm\s+publish\b)", "package-publish"},
    {R"(\byarn\s+publish\b)", "package-publish"},
    {R"(\b(pip|twine)\s+.*\bupload\b)", "package-publish"},
    {R"(\bcargo\s+publish\b)", "package-publish"},

    {R"(\bdocker\s+rm\s+-f\b)", "container-destructive"},
    {R"(\bdocker\s+system\s+prune\b)", "container-destructive"},
    {R"(\bkubectl\s+delete\b)", "container-destructive"},

    {R"(\bdrop\s+(database|table|schema)\b)", "database-destructive"},
    {R"(\btruncate\s+table\b)", "database-destructive"},
    {R"(\bdelete\s+from\s+\w+\s*($|;|where\s+1\b))", "database-destructive"},

    {R"(\bsystemctl\s+(stop|disable|mask)\b)", "service-control"},
    {R"(\bservice\s+\S+\s+stop\b)", "service-control"},

    {R"(\bexport\s+PATH=)", "environment-change"},
    {R"(\.(bashrc|zshrc|profile)\b)", "environment-change"},
};

// Matched against the final path segment only.
const std::vector<PatternDefinition> kFileBlockedDefinitions = {
    {R"(\.env($|\.))", "environment-secrets"},
    {R"(secrets?\.)", "secret-file"},
    {R"(\.secret$)", "secret-file"},
    {R"(credentials?\.)", "credential-file"},

    {R"(\.pem$)", "cryptographic-key"},
    {R"(\.key$)", "cryptographic-key"},
    {R"(\.p12$)", "cryptographic-key"},
    {R"(\.pfx$)", "cryptographic-key"},
    {R"(\.crt$)", "cryptographic-key"},

    {"id_rsa", "ssh-key", MatchKind::Literal},
    {"id_dsa", "ssh-key", MatchKind::Literal},
    {"id_ecdsa", "ssh-key", MatchKind::Literal},
    {"id_ed25519", "ssh-key", MatchKind::Literal},
    {"authorized_keys", "ssh-key", MatchKind::Literal},
    {"known_hosts", "ssh-key", MatchKind::Literal},

    {R"(^\.npmrc$)", "package-credentials"},
    {R"(^\.pypirc$)", "package-credentials"},

    {"kubeconfig", "cloud-credentials", MatchKind::Literal},

    {R"(^\.pgpass$)", "database-credentials"},
    {R"(^\.my\.cnf$)", "database-credentials"},
    {R"(^\.netrc$)", "database-credentials"},

    {".password", "password-file", MatchKind::Literal},
};

// Matched against the whole path after separator canonicalization.
const std::vector<PatternDefinition> kPathBlockedDefinitions = {
    {R"((^|/)\.\.(/|$))", "path-traversal"},
    {"%2e%2e", "path-traversal", MatchKind::Literal},
    {"..%2f", "path-traversal", MatchKind::Literal},
    {"..%5c", "path-traversal", MatchKind::Literal},

    {R"(^\.?ssh(/|$))", "ssh-directory"},
    {R"((^|/)\.ssh(/|$))", "ssh-directory"},

    {R"(^\.?aws(/|$))", "cloud-config"},
    {R"((^|/)\.aws(/|$))", "cloud-config"},
    {R"(^\.?kube(/|$))", "cloud-config"},
    {R"((^|/)\.kube(/|$))", "cloud-config"},
    {R"(^\.?gcloud(/|$))", "cloud-config"},
    {R"((^|/)\.(config/)?gcloud(/|$))", "cloud-config"},
    {R"(^\.?azure(/|$))", "cloud-config"},
    {R"((^|/)\.azure(/|$))", "cloud-config"},

    {R"(^/etc/passwd$)", "system-identity"},
    {R"(^/etc/g?shadow$)", "system-identity"},
    {R"(^/etc/sudoers)", "system-identity"},
    {R"(^/etc/ssh(/|$))", "system-identity"},

    {R"(^\.?gnupg(/|$))", "gpg-keyring"},
    {R"((^|/)\.gnupg(/|$))", "gpg-keyring"},

    {R"((^|/)\.?mozilla/firefox/.*logins)", "browser-credentials"},
    {R"((^|/)\.?config/google-chrome/.*login)", "browser-credentials"},

    {R"((^|/)\.gem/credentials)", "package-credentials"},
    {R"((^|/)\.docker/config\.json$)", "package-credentials"},

    {R"(gcloud.*credentials)", "cloud-credentials"},
};

const std::vector<PatternDefinition> kNoDefinitions;

}  // namespace

std::string to_string(const RegistryKind kind) {
    switch (kind) {
        case RegistryKind::CommandDeny:
            return "command_deny";
        case RegistryKind::CommandWarn:
            return "command_warn";
        case RegistryKind::CommandAllow:
            return "command_allow";
        case RegistryKind::FileBlocked:
            return "file_blocked";
        case RegistryKind::PathBlocked:
            return "path_blocked";
        default:
            return "unknown";
    }
}

std::string to_string(const MatchKind kind) {
    switch (kind) {
        case MatchKind::Regex:
            return "regex";
        case MatchKind::Literal:
            return "literal";
        case MatchKind::Glob:
            return "glob";
        default:
            return "unknown";
    }
}

const std::vector<PatternDefinition>& builtin_definitions(const RegistryKind kind) {
    switch (kind) {
        case RegistryKind::CommandDeny:
            return kCommandDenyDefinitions;
        case RegistryKind::CommandWarn:
            return kCommandWarnDefinitions;
        case RegistryKind::FileBlocked:
            return kFileBlockedDefinitions;
        case RegistryKind::PathBlocked:
            return kPathBlockedDefinitions;
        case RegistryKind::CommandAllow:
        default:
            return kNoDefinitions;
    }
}

std::string glob_to_regex(std::string_view glob) {
    std::string regex = "^";
    std::size_t i = 0;
    while (i < glob.size()) {
        const char c = glob[i];
        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                // "**/" also spans zero directories.
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    regex += "(.*/)?";
                    i += 3;
                } else {
                    regex += ".*";
                    i += 2;
                }
                continue;
            }
            regex += "[^/]*";
        } else if (c == '?') {
            regex += "[^/]";
        } else {
            regex += re2::RE2::QuoteMeta(re2::StringPiece(&glob[i], 1));
        }
        ++i;
    }
    regex += "$";
    return regex;
}

ValidationPattern::ValidationPattern(PatternDefinition definition,
                                     std::shared_ptr<const re2::RE2> regex,
                                     std::string folded_literal)
    : definition_(std::move(definition)),
      regex_(std::move(regex)),
      folded_literal_(std::move(folded_literal)) {}

core::errors::Result<ValidationPattern> ValidationPattern::compile(
    const PatternDefinition& definition, const RegistryKind registry) {
    if (trim(definition.pattern).empty()) {
        return WardenError{ErrorCategory::Config,
                           "Empty pattern in " + to_string(registry) +
                               " (category " + definition.category + ")",
                           "empty_pattern",
                           "Remove the entry or give it a non-blank value."};
    }

    if (definition.kind == MatchKind::Literal) {
        return ValidationPattern(definition, nullptr, fold_ascii(definition.pattern));
    }

    const std::string expression = definition.kind == MatchKind::Glob
                                       ? glob_to_regex(definition.pattern)
                                       : definition.pattern;
    re2::RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);
    auto regex = std::make_shared<const re2::RE2>(expression, options);
    if (!regex->ok()) {
        return WardenError{ErrorCategory::Config,
                           "Invalid pattern in " + to_string(registry) + ": '" +
                               definition.pattern + "': " + regex->error(),
                           "invalid_pattern",
                           "Patterns use RE2 syntax; backreferences and "
                           "lookaround are not supported."};
    }

    // An exemption that matches the empty string exempts every command.
    if (registry == RegistryKind::CommandAllow &&
        re2::RE2::PartialMatch(re2::StringPiece(), *regex)) {
        return WardenError{ErrorCategory::Config,
                           "Allow pattern matches every command: '" +
                               definition.pattern + "'",
                           "overbroad_pattern",
                           "Anchor the pattern to a concrete command."};
    }

    return ValidationPattern(definition, std::move(regex), std::string());
}

bool ValidationPattern::matches(std::string_view subject,
                                std::string_view folded_subject) const {
    if (regex_ == nullptr) {
        return folded_subject.find(folded_literal_) != std::string_view::npos;
    }
    return re2::RE2::PartialMatch(piece(subject), *regex_);
}

PatternRegistry::PatternRegistry(RegistryKind kind, std::vector<ValidationPattern> entries)
    : kind_(kind), entries_(std::move(entries)) {
    has_literals_ = std::any_of(entries_.begin(), entries_.end(),
                                [](const ValidationPattern& entry) {
                                    return entry.kind() == MatchKind::Literal;
                                });
}

core::errors::Result<PatternRegistry> PatternRegistry::compile(
    const RegistryKind kind, const std::vector<PatternDefinition>& definitions) {
    std::vector<ValidationPattern> entries;
    entries.reserve(definitions.size());
    for (const auto& definition : definitions) {
        auto compiled = ValidationPattern::compile(definition, kind);
        if (core::errors::is_error(compiled)) {
            return core::errors::get_error(compiled);
        }
        entries.push_back(std::move(core::errors::get_value(compiled)));
    }
    return PatternRegistry(kind, std::move(entries));
}

const ValidationPattern* PatternRegistry::first_match(std::string_view subject) const {
    const std::string_view trimmed = trim(subject);
    const std::string folded = has_literals_ ? fold_ascii(trimmed) : std::string();
    for (const auto& entry : entries_) {
        if (entry.matches(trimmed, folded)) {
            return &entry;
        }
    }
    return nullptr;
}

core::errors::Result<std::shared_ptr<const PatternSet>> build_pattern_set(
    const PatternConfig& config) {
    // File globs that name a directory are really path rules.
    std::vector<std::string> file_globs;
    std::vector<std::string> path_globs;
    for (const auto& glob : config.blocked_files) {
        if (glob.find('/') != std::string::npos) {
            path_globs.push_back(glob);
        } else {
            file_globs.push_back(glob);
        }
    }

    std::vector<PatternDefinition> path_extra =
        user_definitions(config.blocked_paths, "user-path", MatchKind::Literal);
    auto path_glob_definitions = user_definitions(path_globs, "user-file", MatchKind::Glob);
    path_extra.insert(path_extra.end(), path_glob_definitions.begin(),
                      path_glob_definitions.end());

    auto deny = PatternRegistry::compile(
        RegistryKind::CommandDeny,
        with_builtins(RegistryKind::CommandDeny,
                      user_definitions(config.blocked_commands, "user-blocked",
                                       MatchKind::Regex)));
    if (core::errors::is_error(deny)) {
        return core::errors::get_error(deny);
    }

    auto warn = PatternRegistry::compile(
        RegistryKind::CommandWarn,
        with_builtins(RegistryKind::CommandWarn,
                      user_definitions(config.warning_commands, "user-warning",
                                       MatchKind::Regex)));
    if (core::errors::is_error(warn)) {
        return core::errors::get_error(warn);
    }

    auto allow = PatternRegistry::compile(
        RegistryKind::CommandAllow,
        user_definitions(config.allowed_commands, "user-allowed", MatchKind::Regex));
    if (core::errors::is_error(allow)) {
        return core::errors::get_error(allow);
    }

    auto files = PatternRegistry::compile(
        RegistryKind::FileBlocked,
        with_builtins(RegistryKind::FileBlocked,
                      user_definitions(file_globs, "user-file", MatchKind::Glob)));
    if (core::errors::is_error(files)) {
        return core::errors::get_error(files);
    }

    auto paths = PatternRegistry::compile(
        RegistryKind::PathBlocked,
        with_builtins(RegistryKind::PathBlocked, std::move(path_extra)));
    if (core::errors::is_error(paths)) {
        return core::errors::get_error(paths);
    }

    return std::shared_ptr<const PatternSet>(std::make_shared<PatternSet>(PatternSet{
        std::move(core::errors::get_value(deny)),
        std::move(core::errors::get_value(warn)),
        std::move(core::errors::get_value(allow)),
        std::move(core::errors::get_value(files)),
        std::move(core::errors::get_value(paths))}));
}

}  // namespace warden::policy
