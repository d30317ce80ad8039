#include "policy/file_validator.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "policy/log_sanitizer.hpp"
#include "policy/text_checks.hpp"

namespace warden::policy {

using protocol::SecurityAction;
using protocol::ValidationResult;

FileValidator::FileValidator(std::shared_ptr<const PatternSet> patterns,
                             std::shared_ptr<stats::ValidationStats> stats)
    : patterns_(std::move(patterns)), stats_(std::move(stats)) {}

std::string FileValidator::canonical_separators(std::string_view path) {
    std::string unified(path);
    for (char& c : unified) {
        if (c == '\\') {
            c = '/';
        }
    }

    std::vector<std::string_view> segments;
    std::string_view rest(unified);
    while (!rest.empty()) {
        const std::size_t slash = rest.find('/');
        const std::string_view segment = rest.substr(0, slash);
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        if (slash == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(slash + 1);
    }

    std::string canonical;
    if (!unified.empty() && unified.front() == '/') {
        canonical.push_back('/');
    }
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            canonical.push_back('/');
        }
        canonical.append(segments[i]);
    }
    if (canonical.empty()) {
        canonical = ".";
    }
    return canonical;
}

std::string_view FileValidator::file_name(std::string_view canonical_path) {
    const std::size_t slash = canonical_path.rfind('/');
    if (slash == std::string_view::npos) {
        return canonical_path;
    }
    return canonical_path.substr(slash + 1);
}

ValidationResult FileValidator::validate(std::string_view path) const {
    const auto started = std::chrono::steady_clock::now();
    ValidationResult result;
    try {
        result = decide(path);
        if (result.action == SecurityAction::Deny) {
            WARDEN_LOG_INFO("FileValidator: blocked " + sanitize_log_output(path, 200) +
                            " (" + result.category.value_or("unknown") + ")");
        }
    } catch (const std::exception& ex) {
        WARDEN_LOG_ERROR("FileValidator: " + sanitize_log_output(ex.what()));
        result = protocol::make_verdict(SecurityAction::Deny,
                                        "Validation error - file access denied for safety",
                                        "internal-error", "internal-error");
    }

    if (stats_ != nullptr) {
        stats_->record_file(result.action, std::chrono::steady_clock::now() - started);
    }
    return result;
}

ValidationResult FileValidator::decide(std::string_view path) const {
    if (auto malformed = malformed_reason(path, "Path")) {
        return protocol::make_verdict(SecurityAction::Deny, std::move(*malformed),
                                      "malformed-input", "malformed-input");
    }

    const std::string canonical = canonical_separators(path);
    if (const auto* hit = patterns_->path_blocked.first_match(canonical)) {
        const std::string reason =
            hit->category() == "path-traversal"
                ? std::string("Path traversal detected")
                : "Access to protected path denied (" + hit->category() + ")";
        return protocol::make_verdict(SecurityAction::Deny, reason, hit->source(),
                                      hit->category());
    }

    if (const auto* hit = patterns_->file_blocked.first_match(file_name(canonical))) {
        return protocol::make_verdict(
            SecurityAction::Deny,
            "Access to sensitive file denied (" + hit->category() + ")",
            hit->source(), hit->category());
    }
    return protocol::make_allow();
}

}  // namespace warden::policy
