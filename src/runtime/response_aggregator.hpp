#pragma once

#include <string>
#include <vector>
#include "protocol/execution_result.hpp"
#include "runtime/dependency_installer.hpp"
#include "runtime/execution_runner.hpp"

namespace codebox::runtime {

// success is exactly "no error".
protocol::ExecutionResult aggregate(const std::string& install_output,
                                    ExecutionOutcome outcome,
                                    std::vector<protocol::ArtifactRecord> files,
                                    double elapsed_s);

// Short-circuit result for a failed install: no streams, plots or files.
protocol::ExecutionResult install_failure_result(const InstallOutcome& install,
                                                 double elapsed_s);

}  // namespace codebox::runtime
