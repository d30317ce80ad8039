#include <gtest/gtest.h>
#include "core/errors/warden_errors.hpp"

using namespace warden::core::errors;

// A dummy function to simulate a pattern that fails to compile
Result<std::string> simulate_compile(bool should_fail) {
    if (should_fail) {
        return WardenError{ErrorCategory::Config, "Invalid pattern", "invalid_pattern"};
    }
    return std::string("compiled");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_compile(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "compiled");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_compile(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Config);
    EXPECT_EQ(error.message, "Invalid pattern");
    EXPECT_EQ(error.code, "invalid_pattern");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeToUnknown) {
    const WardenError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, NamesCategories) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
    EXPECT_EQ(to_string(ErrorCategory::Config), "config");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
