#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace codebox::runtime {

// Normalized absolute paths of regular files under the sandbox home directory.
using FilesystemSnapshot = std::set<std::string>;

// One absolute path per line (find output), taken verbatim. Other lines are ignored.
FilesystemSnapshot parse_path_listing(const std::string& listing);

// `ls -la` output: last field of lines with at least nine fields, regular files
// only, "total" line skipped. Names are joined onto `home_directory`.
FilesystemSnapshot parse_long_listing(const std::string& listing,
                                      const std::string& home_directory);

// Paths present in `after` but not in `before`, minus any path containing one of
// the `excluded_patterns` substrings. Lexicographic order.
std::vector<std::string> compute_new_files(const FilesystemSnapshot& before,
                                           const FilesystemSnapshot& after,
                                           const std::vector<std::string>& excluded_patterns);

class SnapshotEngine {
public:
    explicit SnapshotEngine(std::uint32_t depth = 2, std::uint32_t timeout_s = 10);

    // Never fails: listing problems yield an empty snapshot.
    FilesystemSnapshot capture(sandbox::Sandbox& sandbox) const;

    std::string preferred_command(const std::string& home_directory) const;
    std::string fallback_command(const std::string& home_directory) const;

private:
    std::uint32_t depth_;
    std::uint32_t timeout_s_;
};

}  // namespace codebox::runtime
