#include "policy/normalizer.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace warden::policy {

namespace {

int hex_value(const char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool is_octal_digit(const char c) {
    return c >= '0' && c <= '7';
}

bool is_ascii_alpha(const char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_token_char(const char c) {
    return is_ascii_alpha(c) || (c >= '0' && c <= '9') || c == '_' || c == '-' ||
           c == '.' || c == '/';
}

bool has_percent_sequence(std::string_view input) {
    for (std::size_t i = 0; i + 2 < input.size(); ++i) {
        if (input[i] == '%' && hex_value(input[i + 1]) >= 0 &&
            hex_value(input[i + 2]) >= 0) {
            return true;
        }
    }
    return false;
}

std::string percent_decode_pass(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] == '%' && i + 2 < input.size()) {
            const int hi = hex_value(input[i + 1]);
            const int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 3;
                continue;
            }
        }
        out.push_back(input[i]);
        ++i;
    }
    return out;
}

// Minimal UTF-8 reader: malformed lead or continuation bytes come back as a
// single-byte code point so the caller can copy them through untouched.
std::uint32_t read_codepoint(std::string_view input, std::size_t& index,
                             std::size_t& length) {
    const auto lead = static_cast<unsigned char>(input[index]);
    std::size_t extra = 0;
    std::uint32_t value = lead;
    if ((lead & 0xE0U) == 0xC0U) {
        extra = 1;
        value = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
        extra = 2;
        value = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
        extra = 3;
        value = lead & 0x07U;
    }

    if (extra == 0 || index + extra >= input.size()) {
        length = 1;
        ++index;
        return lead;
    }

    for (std::size_t k = 1; k <= extra; ++k) {
        const auto cont = static_cast<unsigned char>(input[index + k]);
        if ((cont & 0xC0U) != 0x80U) {
            length = 1;
            ++index;
            return lead;
        }
        value = (value << 6U) | (cont & 0x3FU);
    }
    length = extra + 1;
    index += length;
    return value;
}

char fold_codepoint(const std::uint32_t cp) {
    // Fullwidth ASCII block.
    if (cp >= 0xFF01U && cp <= 0xFF5EU) {
        return static_cast<char>(cp - 0xFEE0U);
    }

    switch (cp) {
        // Cyrillic lowercase look-alikes.
        case 0x0430U: return 'a';
        case 0x0435U: return 'e';
        case 0x043EU: return 'o';
        case 0x0440U: return 'p';
        case 0x0441U: return 'c';
        case 0x0443U: return 'y';
        case 0x0445U: return 'x';
        case 0x0455U: return 's';
        case 0x0456U: return 'i';
        case 0x0458U: return 'j';
        case 0x04BBU: return 'h';
        case 0x0501U: return 'd';
        case 0x051BU: return 'q';
        // Cyrillic uppercase look-alikes.
        case 0x0405U: return 'S';
        case 0x0406U: return 'I';
        case 0x0408U: return 'J';
        case 0x0410U: return 'A';
        case 0x0412U: return 'B';
        case 0x0415U: return 'E';
        case 0x041AU: return 'K';
        case 0x041CU: return 'M';
        case 0x041DU: return 'H';
        case 0x041EU: return 'O';
        case 0x0420U: return 'P';
        case 0x0421U: return 'C';
        case 0x0422U: return 'T';
        case 0x0425U: return 'X';
        default:
            return '\0';
    }
}

void apply_stage(std::string& current, std::string next, const Transformation stage,
                 NormalizationResult& result) {
    if (next != current) {
        result.transformations.insert(stage);
        current = std::move(next);
    }
}

}  // namespace

std::string to_string(const Transformation transformation) {
    switch (transformation) {
        case Transformation::PercentDecode:
            return "percent_decode";
        case Transformation::HexDecode:
            return "hex_decode";
        case Transformation::OctalDecode:
            return "octal_decode";
        case Transformation::QuoteStrip:
            return "quote_strip";
        case Transformation::BackslashStrip:
            return "backslash_strip";
        case Transformation::HomoglyphFold:
            return "homoglyph_fold";
        default:
            return "unknown";
    }
}

std::string percent_decode(std::string_view input, const std::size_t max_passes,
                           bool* limit_reached) {
    std::string current(input);
    std::size_t passes = 0;
    while (passes < max_passes && has_percent_sequence(current)) {
        current = percent_decode_pass(current);
        ++passes;
    }
    if (limit_reached != nullptr) {
        *limit_reached = has_percent_sequence(current);
    }
    return current;
}

std::string decode_hex_escapes(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] == '\\' && i + 3 < input.size() && input[i + 1] == 'x') {
            const int hi = hex_value(input[i + 2]);
            const int lo = hex_value(input[i + 3]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 4;
                continue;
            }
        }
        out.push_back(input[i]);
        ++i;
    }
    return out;
}

std::string decode_octal_escapes(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] == '\\' && i + 1 < input.size() && is_octal_digit(input[i + 1])) {
            std::size_t digits = 0;
            int value = 0;
            while (digits < 3 && i + 1 + digits < input.size() &&
                   is_octal_digit(input[i + 1 + digits])) {
                value = value * 8 + (input[i + 1 + digits] - '0');
                ++digits;
            }
            if (value <= 127) {
                out.push_back(static_cast<char>(value));
            } else {
                out.append(input.substr(i, digits + 1));
            }
            i += digits + 1;
            continue;
        }
        out.push_back(input[i]);
        ++i;
    }
    return out;
}

std::string strip_quotes(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        const char c = input[i];
        if (c == '\'' || c == '"') {
            const std::size_t close = input.find(c, i + 1);
            if (close != std::string_view::npos) {
                const std::string_view inner = input.substr(i + 1, close - i - 1);
                if (inner.size() <= 1 ||
                    std::all_of(inner.begin(), inner.end(), is_token_char)) {
                    out.append(inner);
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

std::string strip_backslashes(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '\\') {
            out.push_back(input[i]);
            ++i;
            continue;
        }
        if (i + 1 == input.size()) {
            break;
        }
        const char next = input[i + 1];
        if (next == '\n') {
            i += 2;
        } else if (next == '\r' && i + 2 < input.size() && input[i + 2] == '\n') {
            i += 3;
        } else if (is_ascii_alpha(next) || next == '-') {
            out.push_back(next);
            i += 2;
        } else {
            out.push_back('\\');
            ++i;
        }
    }
    return out;
}

std::string fold_homoglyphs(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (static_cast<unsigned char>(input[i]) < 0x80U) {
            out.push_back(input[i]);
            ++i;
            continue;
        }
        const std::size_t start = i;
        std::size_t length = 0;
        const std::uint32_t cp = read_codepoint(input, i, length);
        const char folded = length > 1 ? fold_codepoint(cp) : '\0';
        if (folded != '\0') {
            out.push_back(folded);
        } else {
            out.append(input.substr(start, length));
        }
    }
    return out;
}

Normalizer::Normalizer(NormalizerLimits limits) : limits_(limits) {}

bool Normalizer::needs_decoding(std::string_view raw) {
    for (const char c : raw) {
        if (c == '%' || c == '\\' || c == '\'' || c == '"' ||
            static_cast<unsigned char>(c) >= 0x80U) {
            return true;
        }
    }
    return false;
}

NormalizationResult Normalizer::normalize(std::string_view raw) const {
    NormalizationResult result;
    if (!needs_decoding(raw)) {
        result.normalized.assign(raw.begin(), raw.end());
        return result;
    }

    std::string current(raw);
    bool converged = false;
    for (std::size_t round = 0; round < limits_.max_pipeline_rounds; ++round) {
        const std::string before = current;
        apply_stage(current, percent_decode(current, limits_.max_percent_passes),
                    Transformation::PercentDecode, result);
        apply_stage(current, decode_hex_escapes(current), Transformation::HexDecode,
                    result);
        apply_stage(current, decode_octal_escapes(current),
                    Transformation::OctalDecode, result);
        apply_stage(current, strip_quotes(current), Transformation::QuoteStrip,
                    result);
        apply_stage(current, strip_backslashes(current),
                    Transformation::BackslashStrip, result);
        apply_stage(current, fold_homoglyphs(current),
                    Transformation::HomoglyphFold, result);
        if (current == before) {
            converged = true;
            break;
        }
    }

    // A round that exhausts the %XX pass budget always changes the string, so
    // running out of rounds covers both bounded-decode cases.
    result.decode_limit_reached = !converged;
    result.normalized = std::move(current);
    return result;
}

}  // namespace warden::policy
