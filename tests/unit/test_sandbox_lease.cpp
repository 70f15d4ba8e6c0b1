#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include "fake_sandbox.hpp"
#include "sandbox/sandbox_lease.hpp"

namespace {

using codebox::core::errors::ErrorCategory;
using codebox::core::errors::ExecError;
using codebox::core::errors::get_error;
using codebox::core::errors::is_error;
using codebox::core::errors::take_value;
using codebox::sandbox::SandboxLease;
using codebox::sandbox::SandboxLifecycleManager;
using codebox::testing::FakeProvider;

TEST(SandboxLeaseTest, MissingCredentialIsConfigurationError) {
    FakeProvider provider;
    SandboxLifecycleManager manager(provider);

    auto absent = manager.acquire(std::nullopt);
    ASSERT_TRUE(is_error(absent));
    EXPECT_EQ(get_error(absent).category, ErrorCategory::Configuration);
    EXPECT_EQ(get_error(absent).code, "missing_credential");

    auto empty = manager.acquire(std::string(""));
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).category, ErrorCategory::Configuration);
    EXPECT_TRUE(provider.credentials.empty());
}

TEST(SandboxLeaseTest, ProviderRejectionIsProvisioningError) {
    FakeProvider provider;
    provider.create_error = ExecError{ErrorCategory::Provider, "quota exceeded"};
    SandboxLifecycleManager manager(provider);

    auto result = manager.acquire(std::string("key"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Provisioning);
    EXPECT_EQ(get_error(result).code, "sandbox_provisioning_failed");
    EXPECT_NE(get_error(result).message.find("quota exceeded"), std::string::npos);
    EXPECT_EQ(provider.credentials.size(), 1u);
}

TEST(SandboxLeaseTest, PassesCredentialToProvider) {
    FakeProvider provider;
    SandboxLifecycleManager manager(provider);

    auto result = manager.acquire(std::string("key-7"));
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(provider.credentials.size(), 1u);
    EXPECT_EQ(provider.credentials[0], "key-7");
}

TEST(SandboxLeaseTest, ReleaseIsIdempotent) {
    FakeProvider provider;
    SandboxLifecycleManager manager(provider);
    auto result = manager.acquire(std::string("key"));
    ASSERT_FALSE(is_error(result));

    SandboxLease lease = take_value(result);
    EXPECT_FALSE(lease.released());
    lease.release();
    lease.release();
    EXPECT_TRUE(lease.released());
    EXPECT_EQ(provider.state->destroy_calls, 1);
}

TEST(SandboxLeaseTest, DestructorReleasesUnreleasedLease) {
    FakeProvider provider;
    SandboxLifecycleManager manager(provider);
    {
        auto result = manager.acquire(std::string("key"));
        ASSERT_FALSE(is_error(result));
        SandboxLease lease = take_value(result);
        EXPECT_EQ(provider.state->destroy_calls, 0);
    }
    EXPECT_EQ(provider.state->destroy_calls, 1);
}

TEST(SandboxLeaseTest, MovedFromLeaseDoesNotReleaseTwice) {
    FakeProvider provider;
    SandboxLifecycleManager manager(provider);
    {
        auto result = manager.acquire(std::string("key"));
        ASSERT_FALSE(is_error(result));
        SandboxLease first = take_value(result);
        SandboxLease second = std::move(first);
        EXPECT_TRUE(first.released());
        EXPECT_FALSE(second.released());
    }
    EXPECT_EQ(provider.state->destroy_calls, 1);
}

TEST(SandboxLeaseTest, ReleaseFailuresAreSwallowed) {
    FakeProvider provider;
    provider.state->destroy_error = ExecError{ErrorCategory::Provider, "already gone"};
    SandboxLifecycleManager manager(provider);

    auto result = manager.acquire(std::string("key"));
    ASSERT_FALSE(is_error(result));
    SandboxLease lease = take_value(result);
    lease.release();
    EXPECT_TRUE(lease.released());

    provider.state->destroy_error.reset();
    provider.state->destroy_throws = true;
    auto again = manager.acquire(std::string("key"));
    ASSERT_FALSE(is_error(again));
    SandboxLease throwing = take_value(again);
    EXPECT_NO_THROW(throwing.release());
    EXPECT_TRUE(throwing.released());
    EXPECT_EQ(provider.state->destroy_calls, 2);
}

}  // namespace
