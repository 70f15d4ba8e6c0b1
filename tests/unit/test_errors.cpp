#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/exec_errors.hpp"

using namespace codebox::core::errors;

// A dummy function to simulate a sandbox call failing
Result<std::string> simulate_read_file(bool should_fail) {
    if (should_fail) {
        return ExecError{ErrorCategory::Provider, "File not found", "file_not_found"};
    }
    return std::string("file contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_file(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_file(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Provider);
    EXPECT_EQ(error.message, "File not found");
    EXPECT_EQ(error.code, "file_not_found");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeToUnknown) {
    ExecError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, TakeValueMovesPayloadOut) {
    Result<std::unique_ptr<int>> result = std::make_unique<int>(7);
    auto owned = take_value(result);
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ErrorModelTest, ClassifiesClientErrors) {
    EXPECT_TRUE(is_client_error(ErrorCategory::Input));
    EXPECT_TRUE(is_client_error(ErrorCategory::Configuration));
    EXPECT_FALSE(is_client_error(ErrorCategory::Provisioning));
    EXPECT_FALSE(is_client_error(ErrorCategory::Provider));
    EXPECT_FALSE(is_client_error(ErrorCategory::Internal));
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Configuration), "configuration");
    EXPECT_EQ(to_string(ErrorCategory::Provisioning), "provisioning");
    EXPECT_EQ(to_string(ErrorCategory::Provider), "provider");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
