#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace warden::policy {

enum class Transformation {
    PercentDecode,
    HexDecode,
    OctalDecode,
    QuoteStrip,
    BackslashStrip,
    HomoglyphFold
};

std::string to_string(Transformation transformation);

struct NormalizerLimits {
    // Passes of %XX decoding inside one pipeline round.
    std::size_t max_percent_passes = 5;
    // Full pipeline rounds before giving up on reaching a fixed point.
    std::size_t max_pipeline_rounds = 4;
};

struct NormalizationResult {
    std::string normalized;
    std::set<Transformation> transformations;
    // Set when the pipeline ran out of rounds while input was still decoding.
    bool decode_limit_reached = false;

    bool obfuscated() const { return !transformations.empty(); }
};

// Individual stages, in pipeline order.
std::string percent_decode(std::string_view input, std::size_t max_passes,
                           bool* limit_reached = nullptr);
std::string decode_hex_escapes(std::string_view input);
std::string decode_octal_escapes(std::string_view input);
std::string strip_quotes(std::string_view input);
std::string strip_backslashes(std::string_view input);
std::string fold_homoglyphs(std::string_view input);

class Normalizer {
public:
    explicit Normalizer(NormalizerLimits limits = NormalizerLimits{});

    NormalizationResult normalize(std::string_view raw) const;

    const NormalizerLimits& limits() const { return limits_; }

private:
    static bool needs_decoding(std::string_view raw);

    NormalizerLimits limits_;
};

}  // namespace warden::policy
