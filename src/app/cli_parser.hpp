#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/service_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_request.hpp"

namespace codebox::app::cli {

    enum class CliCommand {
        Run,
        Health
    };

    // Validated command line. File contents are loaded later by build_request.
    struct CliInvocation {
        CliCommand command = CliCommand::Run;
        std::optional<std::string> code;
        std::optional<std::filesystem::path> code_file;
        std::optional<std::filesystem::path> request_file;
        std::optional<std::uint32_t> timeout_s;
        std::vector<std::string> dependencies;
        std::vector<std::string> output_files;
        std::vector<std::filesystem::path> uploads;
        std::optional<std::string> api_key;
        std::optional<std::filesystem::path> config_file;
        bool basic = false;
    };

    codebox::core::errors::Result<CliInvocation> parse_and_validate(int argc, char* argv[]);

    // Loads code, request and upload files and applies config defaults and limits.
    codebox::core::errors::Result<codebox::protocol::ExecutionRequest> build_request(
        const CliInvocation& invocation, const codebox::core::config::ServiceConfig& config);
}
