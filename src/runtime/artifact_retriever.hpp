#pragma once

#include <optional>
#include <string>
#include <vector>
#include "protocol/execution_result.hpp"
#include "sandbox/sandbox.hpp"

namespace codebox::runtime {

std::string basename_of(const std::string& path);

// Ordered read attempts for a diff-detected path: as reported, then the basename
// under the home directory, then the bare basename. Duplicates are dropped.
std::vector<std::string> candidate_paths(const std::string& path,
                                         const std::string& home_directory);

// Raw bytes to record: base64 payload, byte length, basename.
protocol::ArtifactRecord make_record(const std::string& filename,
                                     const sandbox::FileContent& content);

class ArtifactRetriever {
public:
    // Requested paths first (direct reads), then new files not already collected
    // by basename. Individual read failures are logged and skipped.
    std::vector<protocol::ArtifactRecord> collect(
        sandbox::Sandbox& sandbox, const std::vector<std::string>& requested_paths,
        const std::vector<std::string>& new_files) const;
};

}  // namespace codebox::runtime
