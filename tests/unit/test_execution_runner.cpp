#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "fake_sandbox.hpp"
#include "runtime/execution_runner.hpp"

namespace {

using codebox::core::errors::ErrorCategory;
using codebox::core::errors::ExecError;
using codebox::core::errors::get_error;
using codebox::core::errors::get_value;
using codebox::core::errors::is_error;
using codebox::core::errors::Result;
using codebox::protocol::PlotResult;
using codebox::runtime::classify_results;
using codebox::runtime::ExecutionRunner;
using codebox::runtime::join_lines;
using codebox::runtime::merge_result_texts;
using codebox::sandbox::CodeOutcome;
using codebox::sandbox::EmptyValue;
using codebox::sandbox::ImageValue;
using codebox::sandbox::ResultValue;
using codebox::sandbox::TextValue;
using codebox::testing::FakeSandbox;
using codebox::testing::FakeSandboxState;

TEST(ExecutionRunnerTest, JoinsLines) {
    EXPECT_EQ(join_lines({}), "");
    EXPECT_EQ(join_lines({"a"}), "a");
    EXPECT_EQ(join_lines({"a", "b", ""}), "a\nb\n");
}

TEST(ExecutionRunnerTest, MergesResultTexts) {
    EXPECT_EQ(merge_result_texts("", {"2"}), "2");
    EXPECT_EQ(merge_result_texts("hello", {"2", "3"}), "hello\n2\n3");
    EXPECT_EQ(merge_result_texts("hello", {}), "hello");
}

TEST(ExecutionRunnerTest, ClassifiesResultValues) {
    const std::vector<ResultValue> results = {
        TextValue{"42"}, ImageValue{"png", "iVBOR"}, EmptyValue{},
        TextValue{""},   ImageValue{"png", ""},     ImageValue{"svg", "PHN2Zz4="},
    };
    std::vector<PlotResult> plots;
    std::vector<std::string> texts;
    classify_results(results, plots, texts);

    ASSERT_EQ(plots.size(), 2u);
    EXPECT_EQ(plots[0].format, "png");
    EXPECT_EQ(plots[0].data, "iVBOR");
    EXPECT_EQ(plots[1].format, "svg");
    EXPECT_EQ(texts, (std::vector<std::string>{"42"}));
}

TEST(ExecutionRunnerTest, TrailingExpressionBecomesStdout) {
    auto state = std::make_shared<FakeSandboxState>();
    state->on_run_code = [](FakeSandboxState&, const std::string&) -> Result<CodeOutcome> {
        CodeOutcome outcome;
        outcome.results.push_back(TextValue{"2"});
        return outcome;
    };
    FakeSandbox sandbox(state);

    auto ran = ExecutionRunner().run(sandbox, "1+1", 30);
    ASSERT_FALSE(is_error(ran));
    EXPECT_EQ(get_value(ran).stdout_text, "2");
    EXPECT_FALSE(get_value(ran).error.has_value());
    EXPECT_EQ(state->last_timeout_s, 30u);
}

TEST(ExecutionRunnerTest, KeepsExecutionErrorInOutcome) {
    auto state = std::make_shared<FakeSandboxState>();
    state->on_run_code = [](FakeSandboxState&, const std::string&) -> Result<CodeOutcome> {
        CodeOutcome outcome;
        outcome.stdout_lines = {"before"};
        outcome.stderr_lines = {"Traceback (most recent call last):", "..."};
        outcome.error = "ZeroDivisionError: division by zero";
        return outcome;
    };
    FakeSandbox sandbox(state);

    auto ran = ExecutionRunner().run(sandbox, "print('before'); 1/0", 30);
    ASSERT_FALSE(is_error(ran));
    const auto& outcome = get_value(ran);
    EXPECT_EQ(outcome.stdout_text, "before");
    EXPECT_EQ(outcome.stderr_text, "Traceback (most recent call last):\n...");
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error.value(), "ZeroDivisionError: division by zero");
}

TEST(ExecutionRunnerTest, PropagatesProviderFault) {
    auto state = std::make_shared<FakeSandboxState>();
    state->on_run_code = [](FakeSandboxState&, const std::string&) -> Result<CodeOutcome> {
        return ExecError{ErrorCategory::Provider, "connection lost"};
    };
    FakeSandbox sandbox(state);

    auto ran = ExecutionRunner().run(sandbox, "print(1)", 30);
    ASSERT_TRUE(is_error(ran));
    EXPECT_EQ(get_error(ran).category, ErrorCategory::Provider);
}

}  // namespace
