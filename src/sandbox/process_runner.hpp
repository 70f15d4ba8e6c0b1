#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/exec_errors.hpp"

namespace codebox::sandbox {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

struct ProcessRequest {
    std::string command;  // passed to /bin/sh -c
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 5000;  // 0 disables the timeout
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Runs a shell command in its own process group. On timeout or cancellation the
// whole group is killed and the partial output is still returned.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

std::string shell_quote(const std::string& value);

}  // namespace codebox::sandbox
