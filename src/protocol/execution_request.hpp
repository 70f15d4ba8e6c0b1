#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace codebox::protocol {

    // A file the caller ships into the sandbox home directory before the code runs.
    struct UploadedFile {
        std::string filename;             // basename only
        std::vector<std::uint8_t> bytes;
    };

    // Represents a validated execution request. Treated as immutable once accepted.
    struct ExecutionRequest {
        std::string code;                      // untrusted
        std::uint32_t timeout_s = 30;
        std::vector<std::string> dependencies;
        std::vector<std::string> output_files;  // explicitly requested paths
        std::vector<UploadedFile> uploads;
    };

} // namespace codebox::protocol
