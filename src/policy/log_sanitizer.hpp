#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace warden::policy {

constexpr std::size_t kDefaultLogLength = 500;
constexpr std::size_t kCommandLogLength = 200;
constexpr std::string_view kTruncationMarker = "... (truncated)";

// Strips ANSI CSI sequences and every C0 control byte and DEL, then cuts the
// text to max_length bytes (never inside a UTF-8 sequence) and appends
// kTruncationMarker if anything was cut.
std::string sanitize_log_output(std::string_view text,
                                std::size_t max_length = kDefaultLogLength);

// Masks URL credentials, secret-looking assignments and long base64 runs,
// then applies sanitize_log_output with kCommandLogLength.
std::string sanitize_command_for_logging(std::string_view command);

}  // namespace warden::policy
