#include "runtime/execution_runner.hpp"

#include <type_traits>
#include <utility>
#include "core/logging/logger.hpp"

namespace codebox::runtime {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined += lines[i];
    }
    return joined;
}

std::string merge_result_texts(const std::string& stdout_text,
                               const std::vector<std::string>& texts) {
    if (texts.empty()) {
        return stdout_text;
    }
    const std::string result_output = join_lines(texts);
    if (stdout_text.empty()) {
        return result_output;
    }
    return stdout_text + "\n" + result_output;
}

void classify_results(const std::vector<sandbox::ResultValue>& results,
                      std::vector<protocol::PlotResult>& plots,
                      std::vector<std::string>& texts) {
    for (std::size_t i = 0; i < results.size(); ++i) {
        std::visit(
            [&](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, sandbox::ImageValue>) {
                    if (value.data.empty()) {
                        return;
                    }
                    plots.push_back(protocol::PlotResult{value.format, value.data});
                    LOG_INFO("Found plot " + std::to_string(i) + ": " +
                             std::to_string(value.data.size()) + " bytes (base64)");
                } else if constexpr (std::is_same_v<T, sandbox::TextValue>) {
                    if (value.text.empty()) {
                        return;
                    }
                    texts.push_back(value.text);
                    LOG_INFO("Found text result " + std::to_string(i) + ": " +
                             value.text.substr(0, 100));
                }
            },
            results[i]);
    }
}

core::errors::Result<ExecutionOutcome> ExecutionRunner::run(sandbox::Sandbox& sandbox,
                                                            const std::string& code,
                                                            const std::uint32_t timeout_s) const {
    auto ran = sandbox.run_code(code, timeout_s);
    if (core::errors::is_error(ran)) {
        return core::errors::get_error(ran);
    }
    const auto& code_outcome = core::errors::get_value(ran);

    ExecutionOutcome outcome;
    outcome.stdout_text = join_lines(code_outcome.stdout_lines);
    outcome.stderr_text = join_lines(code_outcome.stderr_lines);
    outcome.error = code_outcome.error;
    if (outcome.error.has_value()) {
        LOG_WARN("Execution error: " + *outcome.error);
    }

    std::vector<std::string> texts;
    classify_results(code_outcome.results, outcome.plots, texts);
    outcome.stdout_text = merge_result_texts(outcome.stdout_text, texts);
    return outcome;
}

}  // namespace codebox::runtime
