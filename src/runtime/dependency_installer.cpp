#include "runtime/dependency_installer.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "sandbox/process_runner.hpp"

namespace codebox::runtime {

namespace {

std::string join(const std::vector<std::string>& values, const std::string& separator) {
    std::string joined;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += values[i];
    }
    return joined;
}

InstallOutcome failure(std::string install_output, const std::string& reason) {
    InstallOutcome outcome;
    outcome.success = false;
    outcome.install_output = std::move(install_output);
    outcome.error = "Failed to install dependencies: " + reason;
    LOG_ERROR("Dependency installation failed: " + reason);
    return outcome;
}

}  // namespace

DependencyInstaller::DependencyInstaller(std::string install_command,
                                         const std::uint32_t timeout_s)
    : install_command_(std::move(install_command)), timeout_s_(timeout_s) {}

std::string DependencyInstaller::build_command(
    const std::vector<std::string>& dependencies) const {
    std::string command = install_command_;
    for (const auto& dependency : dependencies) {
        command += " " + sandbox::shell_quote(dependency);
    }
    return command;
}

InstallOutcome DependencyInstaller::install(
    sandbox::Sandbox& sandbox, const std::vector<std::string>& dependencies) const {
    if (dependencies.empty()) {
        return InstallOutcome{};
    }

    LOG_INFO("Installing dependencies: " + join(dependencies, " "));
    auto ran = sandbox.run_command(build_command(dependencies), timeout_s_ * 1000);
    if (core::errors::is_error(ran)) {
        const auto& err = core::errors::get_error(ran);
        return failure(err.message, err.message);
    }

    const auto& command = core::errors::get_value(ran);
    std::string output = command.stdout_text + command.stderr_text;
    if (command.timed_out) {
        return failure(std::move(output), "installation timed out after " +
                                              std::to_string(timeout_s_) + " seconds");
    }
    if (command.exit_code != 0) {
        return failure(std::move(output), "package manager exited with code " +
                                              std::to_string(command.exit_code));
    }

    LOG_INFO("Dependencies installed: " + output.substr(0, 200));
    InstallOutcome outcome;
    outcome.install_output = std::move(output);
    return outcome;
}

}  // namespace codebox::runtime
