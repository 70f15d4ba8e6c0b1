#pragma once

#include <optional>
#include <string>
#include "core/config/service_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_request.hpp"
#include "protocol/execution_result.hpp"
#include "runtime/artifact_retriever.hpp"
#include "runtime/dependency_installer.hpp"
#include "runtime/execution_runner.hpp"
#include "runtime/snapshot_engine.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/sandbox_lease.hpp"

namespace codebox::runtime {

// Drives one request through its own sandbox:
//   acquire -> uploads -> install -> snapshot -> run -> snapshot -> collect -> release.
// Returns an ExecutionResult for business outcomes (success or not). Returns an
// error only for pre-flight failures (Configuration, Provisioning) and for
// provider faults or unexpected exceptions during the pipeline.
// Immutable after construction; safe to share between request threads.
class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(sandbox::SandboxProvider& provider,
                          core::config::ServiceConfig config);

    // Full pipeline with dependency install and artifact recovery.
    core::errors::Result<protocol::ExecutionResult> execute_advanced(
        const protocol::ExecutionRequest& request,
        const std::optional<std::string>& credential_override = std::nullopt) const;

    // Uploads and code only: no install, no snapshots, no artifacts.
    core::errors::Result<protocol::ExecutionResult> execute(
        const protocol::ExecutionRequest& request,
        const std::optional<std::string>& credential_override = std::nullopt) const;

    protocol::HealthStatus health(
        const std::optional<std::string>& credential_override = std::nullopt) const;

private:
    core::errors::Result<protocol::ExecutionResult> run_guarded(
        const protocol::ExecutionRequest& request,
        const std::optional<std::string>& credential_override, bool advanced) const;

    core::errors::Result<protocol::ExecutionResult> run_pipeline(
        const protocol::ExecutionRequest& request,
        const std::optional<std::string>& credential_override, bool advanced) const;

    core::errors::Result<bool> upload_files(sandbox::Sandbox& sandbox,
                                            const protocol::ExecutionRequest& request) const;

    core::config::ServiceConfig config_;
    sandbox::SandboxLifecycleManager lifecycle_;
    DependencyInstaller installer_;
    SnapshotEngine snapshots_;
    ExecutionRunner runner_;
    ArtifactRetriever retriever_;
};

}  // namespace codebox::runtime
