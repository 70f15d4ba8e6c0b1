#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_result.hpp"
#include "sandbox/sandbox.hpp"

namespace codebox::runtime {

struct ExecutionOutcome {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> error;
    std::vector<protocol::PlotResult> plots;
};

// Joins log fragments with '\n'; empty string when there are none.
std::string join_lines(const std::vector<std::string>& lines);

// Appends trailing-expression texts to stdout, one per line, without a leading
// newline when stdout is empty.
std::string merge_result_texts(const std::string& stdout_text,
                               const std::vector<std::string>& texts);

// Splits result values into plots (image data) and texts; EmptyValue and empty
// text are dropped. Order is preserved in both outputs.
void classify_results(const std::vector<sandbox::ResultValue>& results,
                      std::vector<protocol::PlotResult>& plots,
                      std::vector<std::string>& texts);

class ExecutionRunner {
public:
    // An execution-level error is part of the outcome. A provider fault is
    // returned as an error for the caller to convert.
    core::errors::Result<ExecutionOutcome> run(sandbox::Sandbox& sandbox,
                                               const std::string& code,
                                               std::uint32_t timeout_s) const;
};

}  // namespace codebox::runtime
