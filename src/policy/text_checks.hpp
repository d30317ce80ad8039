#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace warden::policy {

bool is_valid_utf8(std::string_view text);

// Why `text` cannot be validated as a `subject` ("Command", "Path"), or
// nullopt when it is non-blank, NUL-free, valid UTF-8.
std::optional<std::string> malformed_reason(std::string_view text,
                                            std::string_view subject);

}  // namespace warden::policy
