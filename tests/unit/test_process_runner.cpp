#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <gtest/gtest.h>
#include "sandbox/process_runner.hpp"

namespace {

using codebox::core::errors::get_value;
using codebox::core::errors::is_error;
using codebox::sandbox::ProcessRequest;
using codebox::sandbox::run_process;
using codebox::sandbox::shell_quote;

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    ProcessRequest request;
    request.command = "printf 'out'; printf 'err' >&2; exit 3";
    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));

    const auto& capture = get_value(result);
    EXPECT_EQ(capture.stdout_text, "out");
    EXPECT_EQ(capture.stderr_text, "err");
    EXPECT_EQ(capture.exit_code, 3);
    EXPECT_FALSE(capture.timed_out);
    EXPECT_FALSE(capture.cancelled);
}

TEST(ProcessRunnerTest, KillsProcessGroupOnTimeout) {
    ProcessRequest request;
    request.command = "echo started; sleep 5 & sleep 5";
    request.timeout_ms = 200;
    const auto started = std::chrono::steady_clock::now();
    auto result = run_process(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(is_error(result));

    EXPECT_TRUE(get_value(result).timed_out);
    EXPECT_EQ(get_value(result).stdout_text, "started\n");
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(ProcessRunnerTest, StopsWhenCancelled) {
    ProcessRequest request;
    request.command = "sleep 5";
    request.timeout_ms = 0;
    request.cancel_token = std::make_shared<std::atomic_bool>(false);

    std::thread canceller([token = request.cancel_token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token->store(true);
    });
    auto result = run_process(request);
    canceller.join();
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
}

TEST(ProcessRunnerTest, QuotesShellArguments) {
    EXPECT_EQ(shell_quote("plain"), "'plain'");
    EXPECT_EQ(shell_quote("a b;rm"), "'a b;rm'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

}  // namespace
