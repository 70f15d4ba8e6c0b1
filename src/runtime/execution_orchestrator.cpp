#include "runtime/execution_orchestrator.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "runtime/response_aggregator.hpp"
#include "session/credential_resolver.hpp"

namespace codebox::runtime {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using protocol::ExecutionRequest;
using protocol::ExecutionResult;

namespace {

double seconds_since(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
}

std::string join(const std::vector<std::string>& values) {
    std::string joined = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        joined += (i > 0 ? ", " : "") + values[i];
    }
    return joined + "]";
}

ExecError sandbox_failure(const std::string& message) {
    return ExecError{ErrorCategory::Provider, "Sandbox execution failed: " + message,
                     "sandbox_execution_failed"};
}

}  // namespace

ExecutionOrchestrator::ExecutionOrchestrator(sandbox::SandboxProvider& provider,
                                             core::config::ServiceConfig config)
    : config_(std::move(config)),
      lifecycle_(provider),
      installer_(config_.install_command, config_.install_timeout_s),
      snapshots_(config_.listing_depth, config_.listing_timeout_s) {}

core::errors::Result<ExecutionResult> ExecutionOrchestrator::execute_advanced(
    const ExecutionRequest& request,
    const std::optional<std::string>& credential_override) const {
    return run_guarded(request, credential_override, true);
}

core::errors::Result<ExecutionResult> ExecutionOrchestrator::execute(
    const ExecutionRequest& request,
    const std::optional<std::string>& credential_override) const {
    return run_guarded(request, credential_override, false);
}

protocol::HealthStatus ExecutionOrchestrator::health(
    const std::optional<std::string>& credential_override) const {
    protocol::HealthStatus status;
    status.credential_configured =
        session::resolve_credential(credential_override, config_.default_credential)
            .has_value();
    return status;
}

core::errors::Result<ExecutionResult> ExecutionOrchestrator::run_guarded(
    const ExecutionRequest& request, const std::optional<std::string>& credential_override,
    const bool advanced) const {
    const std::string current_id = core::logging::Logger::request_id();
    core::logging::ScopedRequestTag tag(current_id.empty() ? core::config::generate_request_id()
                                                           : current_id);
    try {
        return run_pipeline(request, credential_override, advanced);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Sandbox execution failed: ") + e.what());
        return ExecError{ErrorCategory::Internal,
                         std::string("Sandbox execution failed: ") + e.what(),
                         "unexpected_fault"};
    } catch (...) {
        LOG_ERROR("Sandbox execution failed: unknown exception");
        return ExecError{ErrorCategory::Internal,
                         "Sandbox execution failed: unknown exception", "unexpected_fault"};
    }
}

core::errors::Result<bool> ExecutionOrchestrator::upload_files(
    sandbox::Sandbox& sandbox, const ExecutionRequest& request) const {
    for (const auto& upload : request.uploads) {
        auto written = sandbox.write_file(upload.filename, upload.bytes);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
        LOG_INFO("Uploaded file: " + upload.filename + " (" +
                 std::to_string(core::errors::get_value(written)) + " bytes)");
    }
    return true;
}

core::errors::Result<ExecutionResult> ExecutionOrchestrator::run_pipeline(
    const ExecutionRequest& request, const std::optional<std::string>& credential_override,
    const bool advanced) const {
    LOG_INFO((advanced ? "Advanced execution: code=" : "Executing code: code=") +
             std::to_string(request.code.size()) + " chars, deps=" +
             join(request.dependencies) + ", output_files=" + join(request.output_files));

    const auto credential =
        session::resolve_credential(credential_override, config_.default_credential);
    auto acquired = lifecycle_.acquire(credential);
    if (core::errors::is_error(acquired)) {
        return core::errors::get_error(acquired);
    }
    // Released on every path out of this scope, including exceptions.
    sandbox::SandboxLease lease = core::errors::take_value(acquired);
    sandbox::Sandbox& box = lease.sandbox();
    const auto started = std::chrono::steady_clock::now();

    auto uploaded = upload_files(box, request);
    if (core::errors::is_error(uploaded)) {
        return sandbox_failure(core::errors::get_error(uploaded).message);
    }

    std::string install_output;
    FilesystemSnapshot before;
    if (advanced) {
        const InstallOutcome install = installer_.install(box, request.dependencies);
        if (!install.success) {
            return install_failure_result(install, seconds_since(started));
        }
        install_output = install.install_output;

        before = snapshots_.capture(box);
        LOG_INFO("Files before execution: " + std::to_string(before.size()));
    }

    auto ran = runner_.run(box, request.code, request.timeout_s);
    if (core::errors::is_error(ran)) {
        const auto& err = core::errors::get_error(ran);
        LOG_ERROR("Sandbox execution failed [" + err.code + "]: " + err.message);
        return sandbox_failure(err.message);
    }
    ExecutionOutcome outcome = core::errors::take_value(ran);

    std::vector<protocol::ArtifactRecord> files;
    if (advanced) {
        const FilesystemSnapshot after = snapshots_.capture(box);
        const auto new_files = compute_new_files(before, after, config_.excluded_patterns);
        LOG_INFO("Files after execution: " + std::to_string(after.size()) +
                 ", new files detected: " + join(new_files));
        files = retriever_.collect(box, request.output_files, new_files);
    }

    const double elapsed_s = seconds_since(started);
    ExecutionResult result =
        aggregate(install_output, std::move(outcome), std::move(files), elapsed_s);
    lease.release();

    LOG_INFO("Execution completed: success=" + std::string(result.success ? "true" : "false") +
             ", plots=" + std::to_string(result.plots.size()) +
             ", files=" + std::to_string(result.files.size()) +
             ", time=" + std::to_string(elapsed_s) + "s");
    return result;
}

}  // namespace codebox::runtime
