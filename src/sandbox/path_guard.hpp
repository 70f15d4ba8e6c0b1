#pragma once

#include <filesystem>
#include <string>
#include "core/errors/exec_errors.hpp"

namespace codebox::sandbox {

// Confines file access of a local sandbox to its home directory.
class PathGuard {
public:
    explicit PathGuard(std::filesystem::path home_directory);

    // Relative targets resolve against the home directory. Symlinks are followed
    // for the existing prefix, so a link pointing outside is rejected too.
    core::errors::Result<std::filesystem::path> resolve(const std::string& target) const;

    const std::filesystem::path& home() const { return home_; }

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    std::filesystem::path home_;
};

}  // namespace codebox::sandbox
