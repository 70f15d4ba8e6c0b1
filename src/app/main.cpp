#include <iostream>
#include <optional>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/request_id.hpp"
#include "core/config/service_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/request_codec.hpp"
#include "runtime/execution_orchestrator.hpp"
#include "sandbox/local_process_sandbox.hpp"
#include "session/execution_journal.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitBusinessFailure = 1;
constexpr int kExitInput = 2;
constexpr int kExitConfiguration = 3;
constexpr int kExitServer = 4;

int exit_code_for(const codebox::core::errors::ExecError& err) {
    switch (err.category) {
        case codebox::core::errors::ErrorCategory::Input:
            return kExitInput;
        case codebox::core::errors::ErrorCategory::Configuration:
            return kExitConfiguration;
        default:
            return kExitServer;
    }
}

void report_error(const std::string& context, const codebox::core::errors::ExecError& err) {
    LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this process with one request id
    const std::string request_id = codebox::core::config::generate_request_id();
    codebox::core::logging::ScopedRequestTag tag(request_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = codebox::app::cli::parse_and_validate(argc, argv);
    if (codebox::core::errors::is_error(parsed)) {
        report_error("Input error", codebox::core::errors::get_error(parsed));
        return kExitInput;
    }
    const auto& invocation = codebox::core::errors::get_value(parsed);

    // 3. Configuration: defaults, config file, environment
    auto loaded = codebox::core::config::load_service_config(invocation.config_file);
    if (codebox::core::errors::is_error(loaded)) {
        const auto& err = codebox::core::errors::get_error(loaded);
        report_error("Configuration error", err);
        return exit_code_for(err);
    }
    const auto& config = codebox::core::errors::get_value(loaded);
    codebox::core::logging::Logger::get().set_min_level(config.log_level);

    codebox::sandbox::LocalSandboxOptions sandbox_options;
    sandbox_options.sandbox_root = config.sandbox_root;
    sandbox_options.interpreter = config.interpreter;
    sandbox_options.capture_result_values = config.capture_result_values;
    codebox::sandbox::LocalProcessSandboxProvider provider(sandbox_options);
    codebox::runtime::ExecutionOrchestrator orchestrator(provider, config);

    if (invocation.command == codebox::app::cli::CliCommand::Health) {
        std::cout << codebox::protocol::dump_json(
                         codebox::protocol::to_json(orchestrator.health(invocation.api_key)))
                  << std::endl;
        return kExitSuccess;
    }

    auto built = codebox::app::cli::build_request(invocation, config);
    if (codebox::core::errors::is_error(built)) {
        report_error("Input error", codebox::core::errors::get_error(built));
        return kExitInput;
    }
    const auto& request = codebox::core::errors::get_value(built);

    std::optional<codebox::session::ExecutionJournal> journal;
    if (config.journal_dir.has_value()) {
        journal.emplace(config.journal_dir.value());
        auto written = journal->write_request(request_id, request,
                                              invocation.basic ? "basic" : "advanced");
        if (codebox::core::errors::is_error(written)) {
            report_error("Failed to write request journal",
                         codebox::core::errors::get_error(written));
        }
    }

    // 4. Run the request through its own sandbox
    auto executed = invocation.basic ? orchestrator.execute(request, invocation.api_key)
                                     : orchestrator.execute_advanced(request, invocation.api_key);
    if (codebox::core::errors::is_error(executed)) {
        const auto& err = codebox::core::errors::get_error(executed);
        report_error("Execution failed", err);
        if (journal.has_value()) {
            auto written = journal->write_failure(request_id, err);
            if (codebox::core::errors::is_error(written)) {
                report_error("Failed to write final journal",
                             codebox::core::errors::get_error(written));
            }
        }
        return exit_code_for(err);
    }

    const auto& result = codebox::core::errors::get_value(executed);
    if (journal.has_value()) {
        auto written = journal->write_final(request_id, result);
        if (codebox::core::errors::is_error(written)) {
            report_error("Failed to write final journal",
                         codebox::core::errors::get_error(written));
        } else {
            LOG_INFO("Journal: " + codebox::core::errors::get_value(written).string());
        }
    }

    // 5. The result JSON is the only thing on stdout
    std::cout << codebox::protocol::dump_json(codebox::protocol::to_json(result)) << std::endl;
    return result.success ? kExitSuccess : kExitBusinessFailure;
}
