#include "policy/log_sanitizer.hpp"

#include <re2/re2.h>

namespace warden::policy {

namespace {

bool is_control(const unsigned char c) {
    return c < 0x20U || c == 0x7FU;
}

// U+0080..U+009F encode as C2 80..C2 9F. U+009B acts as CSI on some terminals.
bool is_c1_control(std::string_view text, const std::size_t start) {
    return start + 1 < text.size() && static_cast<unsigned char>(text[start]) == 0xC2U &&
           static_cast<unsigned char>(text[start + 1]) >= 0x80U &&
           static_cast<unsigned char>(text[start + 1]) <= 0x9FU;
}

// ESC '[' parameters final-letter
std::size_t csi_length(std::string_view text, const std::size_t start) {
    if (start + 1 >= text.size() || text[start] != '\x1B' || text[start + 1] != '[') {
        return 0;
    }
    std::size_t i = start + 2;
    while (i < text.size() && ((text[i] >= '0' && text[i] <= '9') || text[i] == ';')) {
        ++i;
    }
    if (i < text.size() &&
        ((text[i] >= 'a' && text[i] <= 'z') || (text[i] >= 'A' && text[i] <= 'Z'))) {
        return i - start + 1;
    }
    return 0;
}

std::size_t utf8_safe_cut(const std::string& text, std::size_t cut) {
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
        --cut;
    }
    return cut;
}

const re2::RE2& url_credentials() {
    static const re2::RE2 pattern(R"((://[^:/@\s]+:)[^@\s]+(@))");
    return pattern;
}

const re2::RE2& secret_assignment() {
    static const re2::RE2 pattern(
        R"((?i)((?:PASSWORD|PASSWD|SECRET|API_KEY|TOKEN|AUTH|KEY)\s*[=:]\s*)[^\s'"]+)");
    return pattern;
}

const re2::RE2& base64_run() {
    static const re2::RE2 pattern(R"([A-Za-z0-9+/]{40,}={0,2})");
    return pattern;
}

}  // namespace

std::string sanitize_log_output(std::string_view text, const std::size_t max_length) {
    std::string sanitized;
    sanitized.reserve(text.size() < max_length ? text.size() : max_length);
    std::size_t i = 0;
    while (i < text.size()) {
        const std::size_t skip = csi_length(text, i);
        if (skip > 0) {
            i += skip;
            continue;
        }
        if (is_c1_control(text, i)) {
            i += 2;
            continue;
        }
        const auto c = static_cast<unsigned char>(text[i]);
        if (!is_control(c)) {
            sanitized.push_back(text[i]);
        }
        ++i;
    }

    if (sanitized.size() > max_length) {
        sanitized.resize(utf8_safe_cut(sanitized, max_length));
        sanitized.append(kTruncationMarker);
    }
    return sanitized;
}

std::string sanitize_command_for_logging(std::string_view command) {
    std::string masked(command);
    re2::RE2::GlobalReplace(&masked, url_credentials(), R"(\1***\2)");
    re2::RE2::GlobalReplace(&masked, secret_assignment(), R"(\1***)");
    re2::RE2::GlobalReplace(&masked, base64_run(), "[BASE64_REDACTED]");
    return sanitize_log_output(masked, kCommandLogLength);
}

}  // namespace warden::policy
