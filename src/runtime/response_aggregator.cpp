#include "runtime/response_aggregator.hpp"

#include <utility>

namespace codebox::runtime {

protocol::ExecutionResult aggregate(const std::string& install_output,
                                    ExecutionOutcome outcome,
                                    std::vector<protocol::ArtifactRecord> files,
                                    const double elapsed_s) {
    protocol::ExecutionResult result;
    result.success = !outcome.error.has_value();
    result.stdout_text = std::move(outcome.stdout_text);
    result.stderr_text = std::move(outcome.stderr_text);
    result.error = std::move(outcome.error);
    result.plots = std::move(outcome.plots);
    result.files = std::move(files);
    result.execution_time_s = elapsed_s;
    result.install_output = install_output;
    return result;
}

protocol::ExecutionResult install_failure_result(const InstallOutcome& install,
                                                 const double elapsed_s) {
    protocol::ExecutionResult result;
    result.success = false;
    result.error = install.error.has_value() ? install.error
                                             : std::optional<std::string>(
                                                   "Failed to install dependencies");
    result.execution_time_s = elapsed_s;
    result.install_output = install.install_output;
    return result;
}

}  // namespace codebox::runtime
