#include "core/config/security_config.hpp"

#include <fstream>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace warden::core::config {

using errors::ErrorCategory;
using errors::WardenError;
using nlohmann::json;

namespace {

WardenError invalid_field(const std::string& field_path, const std::string& expected) {
    return WardenError{ErrorCategory::Config,
                       "Configuration field " + field_path + " must be " + expected,
                       "invalid_config_field"};
}

errors::Result<std::vector<std::string>> read_string_list(const json& section,
                                                          const std::string& prefix,
                                                          const char* key) {
    std::vector<std::string> values;
    const auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return values;
    }

    const std::string field_path = prefix + key;
    if (!it->is_array()) {
        return invalid_field(field_path, "an array of strings");
    }
    values.reserve(it->size());
    for (std::size_t i = 0; i < it->size(); ++i) {
        const json& entry = (*it)[i];
        if (!entry.is_string()) {
            return invalid_field(field_path + "[" + std::to_string(i) + "]", "a string");
        }
        values.push_back(entry.get<std::string>());
    }
    return values;
}

}  // namespace

errors::Result<policy::PatternConfig> parse_security_config(const json& document) {
    if (!document.is_object()) {
        return invalid_field("<root>", "an object");
    }

    const json* section = &document;
    std::string prefix;
    const auto security = document.find("security");
    if (security != document.end()) {
        if (!security->is_object()) {
            return invalid_field("security", "an object");
        }
        section = &*security;
        prefix = "security.";
    }

    policy::PatternConfig config;
    const std::pair<const char*, std::vector<std::string>*> fields[] = {
        {"blockedPatterns", &config.blocked_commands},
        {"warningPatterns", &config.warning_commands},
        {"allowedPatterns", &config.allowed_commands},
        {"blockedFiles", &config.blocked_files},
        {"blockedPaths", &config.blocked_paths},
    };
    for (const auto& field : fields) {
        auto values = read_string_list(*section, prefix, field.first);
        if (errors::is_error(values)) {
            return errors::get_error(values);
        }
        *field.second = std::move(errors::get_value(values));
    }
    return config;
}

errors::Result<policy::PatternConfig> load_security_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return WardenError{ErrorCategory::Config,
                           "Unable to open configuration file: " + path.string(),
                           "config_not_found",
                           "Check the --config path."};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return WardenError{ErrorCategory::Config,
                           "Configuration file is not valid JSON: " + path.string(),
                           "config_parse_error"};
    }

    auto config = parse_security_config(document);
    if (!errors::is_error(config)) {
        const auto& loaded = errors::get_value(config);
        WARDEN_LOG_DEBUG("SecurityConfig: " + path.string() + " adds " +
                         std::to_string(loaded.blocked_commands.size() +
                                        loaded.warning_commands.size() +
                                        loaded.allowed_commands.size()) +
                         " command and " +
                         std::to_string(loaded.blocked_files.size() +
                                        loaded.blocked_paths.size()) +
                         " file patterns");
    }
    return config;
}

}  // namespace warden::core::config
