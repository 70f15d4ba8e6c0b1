#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "fake_sandbox.hpp"
#include "runtime/dependency_installer.hpp"

namespace {

using codebox::core::errors::ErrorCategory;
using codebox::core::errors::ExecError;
using codebox::core::errors::Result;
using codebox::runtime::DependencyInstaller;
using codebox::sandbox::CommandOutcome;
using codebox::testing::FakeSandbox;
using codebox::testing::FakeSandboxState;

TEST(DependencyInstallerTest, EmptyListIsNoOp) {
    auto state = std::make_shared<FakeSandboxState>();
    FakeSandbox sandbox(state);

    const auto outcome = DependencyInstaller().install(sandbox, {});
    EXPECT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.install_output.empty());
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_TRUE(state->commands.empty());
}

TEST(DependencyInstallerTest, QuotesEveryPackage) {
    DependencyInstaller installer("pip install -q", 60);
    EXPECT_EQ(installer.build_command({"numpy", "pandas>=2.0", "it's"}),
              "pip install -q 'numpy' 'pandas>=2.0' 'it'\\''s'");
}

TEST(DependencyInstallerTest, RunsOneCommandAndCapturesOutput) {
    auto state = std::make_shared<FakeSandboxState>();
    state->on_command = [](FakeSandboxState&, const std::string&) -> Result<CommandOutcome> {
        CommandOutcome outcome;
        outcome.exit_code = 0;
        outcome.stdout_text = "Successfully installed numpy\n";
        outcome.stderr_text = "WARNING: running as root\n";
        return outcome;
    };
    FakeSandbox sandbox(state);

    const auto outcome = DependencyInstaller().install(sandbox, {"numpy", "pandas"});
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.install_output,
              "Successfully installed numpy\nWARNING: running as root\n");
    ASSERT_EQ(state->commands.size(), 1u);
    EXPECT_EQ(state->commands[0], "pip install -q 'numpy' 'pandas'");
}

TEST(DependencyInstallerTest, NonZeroExitIsFailure) {
    auto state = std::make_shared<FakeSandboxState>();
    state->on_command = [](FakeSandboxState&, const std::string&) -> Result<CommandOutcome> {
        CommandOutcome outcome;
        outcome.exit_code = 1;
        outcome.stderr_text = "ERROR: No matching distribution found for nonexistent-pkg-xyz\n";
        return outcome;
    };
    FakeSandbox sandbox(state);

    const auto outcome = DependencyInstaller().install(sandbox, {"nonexistent-pkg-xyz"});
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->rfind("Failed to install dependencies: ", 0), 0u);
    EXPECT_NE(outcome.install_output.find("No matching distribution"), std::string::npos);
}

TEST(DependencyInstallerTest, TimeoutIsFailure) {
    auto state = std::make_shared<FakeSandboxState>();
    state->on_command = [](FakeSandboxState&, const std::string&) -> Result<CommandOutcome> {
        CommandOutcome outcome;
        outcome.timed_out = true;
        return outcome;
    };
    FakeSandbox sandbox(state);

    const auto outcome = DependencyInstaller("pip install -q", 5).install(sandbox, {"numpy"});
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("timed out after 5 seconds"), std::string::npos);
}

TEST(DependencyInstallerTest, TransportFaultIsFailure) {
    auto state = std::make_shared<FakeSandboxState>();
    state->on_command = [](FakeSandboxState&, const std::string&) -> Result<CommandOutcome> {
        return ExecError{ErrorCategory::Provider, "sandbox unreachable"};
    };
    FakeSandbox sandbox(state);

    const auto outcome = DependencyInstaller().install(sandbox, {"numpy"});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.install_output, "sandbox unreachable");
    EXPECT_EQ(outcome.error.value_or(""),
              "Failed to install dependencies: sandbox unreachable");
}

}  // namespace
