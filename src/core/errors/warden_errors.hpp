#pragma once
#include <string>
#include <variant>

namespace warden::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., CLI flag missing or malformed tool input
        Policy,     // E.g., a command or path was refused by the guard
        Config,     // E.g., a user pattern that does not compile
        Internal    // E.g., C++ logic bug or allocation failure
    };

    // The standardized error payload
    struct WardenError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a WardenError.
    template <typename T>
    using Result = std::variant<T, WardenError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<WardenError>(result);
    }

    template <typename T>
    const WardenError& get_error(const Result<T>& result) {
        return std::get<WardenError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Policy:   return "policy";
            case ErrorCategory::Config:   return "config";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace warden::core::errors
