#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace codebox::protocol {

struct PlotResult {
    std::string format;  // "png", "svg", ...
    std::string data;    // base64, as produced by the sandbox
};

// One recovered file. Directory structure is not preserved.
struct ArtifactRecord {
    std::string filename;
    std::string data;  // base64
    std::size_t size = 0;
};

struct ExecutionResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> error;
    std::vector<PlotResult> plots;
    std::vector<ArtifactRecord> files;
    double execution_time_s = 0.0;
    std::string install_output;
};

struct HealthStatus {
    std::string status = "healthy";
    std::string service = "codebox-executor";
    bool credential_configured = false;
};

}  // namespace codebox::protocol
