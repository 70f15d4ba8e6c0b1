#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace codebox::runtime {

struct InstallOutcome {
    bool success = true;
    std::string install_output;        // combined stdout + stderr
    std::optional<std::string> error;  // set when success is false
};

class DependencyInstaller {
public:
    explicit DependencyInstaller(std::string install_command = "pip install -q",
                                 std::uint32_t timeout_s = 60);

    // No-op for an empty dependency list. One package-manager invocation otherwise.
    InstallOutcome install(sandbox::Sandbox& sandbox,
                           const std::vector<std::string>& dependencies) const;

    std::string build_command(const std::vector<std::string>& dependencies) const;

private:
    std::string install_command_;
    std::uint32_t timeout_s_;
};

}  // namespace codebox::runtime
