#include "policy/text_checks.hpp"

namespace warden::policy {

bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        if (lead < 0x80U) {
            ++i;
            continue;
        }
        if ((lead & 0xE0U) == 0xC0U && lead >= 0xC2U) {
            extra = 1;
        } else if ((lead & 0xF0U) == 0xE0U) {
            extra = 2;
        } else if ((lead & 0xF8U) == 0xF0U && lead <= 0xF4U) {
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0U) != 0x80U) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

std::optional<std::string> malformed_reason(std::string_view text,
                                            std::string_view subject) {
    const std::string name(subject);
    if (text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos) {
        return name + " is empty";
    }
    if (text.find('\0') != std::string_view::npos) {
        return name + " contains a NUL byte";
    }
    if (!is_valid_utf8(text)) {
        return name + " is not valid UTF-8";
    }
    return std::nullopt;
}

}  // namespace warden::policy
