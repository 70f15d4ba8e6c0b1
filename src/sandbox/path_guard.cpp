#include "sandbox/path_guard.hpp"

#include <system_error>
#include <utility>

namespace codebox::sandbox {

using core::errors::ErrorCategory;
using core::errors::ExecError;

PathGuard::PathGuard(std::filesystem::path home_directory)
    : home_(std::move(home_directory)) {}

bool PathGuard::is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> PathGuard::resolve(
    const std::string& target) const {
    if (target.empty()) {
        return ExecError{ErrorCategory::Provider, "Path cannot be empty.", "invalid_path"};
    }

    std::error_code ec;
    const std::filesystem::path canonical_home =
        std::filesystem::weakly_canonical(home_, ec);
    if (ec) {
        return ExecError{ErrorCategory::Provider,
                         "Unable to resolve sandbox home: " + home_.string(),
                         "invalid_sandbox_home"};
    }

    std::filesystem::path candidate(target);
    if (candidate.is_relative()) {
        candidate = canonical_home / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ExecError{ErrorCategory::Provider, "Unable to resolve path: " + target,
                         "invalid_path"};
    }

    if (!is_within_root(canonical_home, canonical_candidate)) {
        return ExecError{ErrorCategory::Provider,
                         "Path escapes sandbox home: " + canonical_candidate.string(),
                         "path_outside_sandbox"};
    }

    return canonical_candidate;
}

}  // namespace codebox::sandbox
