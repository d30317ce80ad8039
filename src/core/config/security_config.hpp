#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/warden_errors.hpp"
#include "policy/pattern_registry.hpp"

namespace warden::core::config {

// Reads the pattern lists from a JSON document. The lists may sit at the
// root or under a "security" object:
//
//   { "security": { "blockedPatterns": ["..."], "warningPatterns": [],
//                   "allowedPatterns": [], "blockedFiles": ["*.vault"],
//                   "blockedPaths": ["/srv/keys/"] } }
//
// Every key is optional. Unknown keys are ignored.
errors::Result<policy::PatternConfig> parse_security_config(const nlohmann::json& document);

errors::Result<policy::PatternConfig> load_security_config(const std::filesystem::path& path);

}  // namespace warden::core::config
