#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "core/errors/exec_errors.hpp"

namespace codebox::sandbox {

// Result values produced by the trailing expression of a code submission.
struct ImageValue {
    std::string format;  // "png", "svg", ...
    std::string data;    // already base64 encoded
};

struct TextValue {
    std::string text;
};

struct EmptyValue {};

using ResultValue = std::variant<ImageValue, TextValue, EmptyValue>;

struct CodeOutcome {
    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;
    std::optional<std::string> error;  // execution-level error (code raised)
    std::vector<ResultValue> results;
};

struct CommandOutcome {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    bool timed_out = false;
};

// Providers may hand back either raw bytes or decoded text.
using FileContent = std::variant<std::vector<std::uint8_t>, std::string>;

// One isolated execution environment. Transport faults come back as
// ErrorCategory::Provider errors; an execution-level error is part of CodeOutcome.
class Sandbox {
public:
    virtual ~Sandbox() = default;

    virtual const std::string& id() const = 0;
    virtual std::string home_directory() const = 0;

    virtual core::errors::Result<CodeOutcome> run_code(const std::string& code,
                                                       std::uint32_t timeout_s) = 0;

    virtual core::errors::Result<CommandOutcome> run_command(const std::string& command,
                                                             std::uint32_t timeout_ms) = 0;

    virtual core::errors::Result<FileContent> read_file(const std::string& path) = 0;

    virtual core::errors::Result<std::size_t> write_file(
        const std::string& path, const std::vector<std::uint8_t>& bytes) = 0;

    // True when this call released the environment, false when it was already gone.
    virtual core::errors::Result<bool> destroy() = 0;
};

class SandboxProvider {
public:
    virtual ~SandboxProvider() = default;

    virtual core::errors::Result<std::unique_ptr<Sandbox>> create(
        const std::string& credential) = 0;
};

}  // namespace codebox::sandbox
