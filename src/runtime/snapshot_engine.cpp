#include "runtime/snapshot_engine.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include "core/logging/logger.hpp"
#include "sandbox/process_runner.hpp"

namespace codebox::runtime {

namespace {

std::string trim(const std::string& line) {
    const auto begin = line.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = line.find_last_not_of(" \t\r");
    return line.substr(begin, end - begin + 1);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> fields;
    std::string field;
    while (in >> field) {
        fields.push_back(field);
    }
    return fields;
}

std::string strip_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

FilesystemSnapshot parse_path_listing(const std::string& listing) {
    FilesystemSnapshot snapshot;
    std::istringstream in(listing);
    std::string line;
    while (std::getline(in, line)) {
        // Whitespace is part of a file name; only a CR line ending is dropped.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty() && line.front() == '/') {
            snapshot.insert(line);
        }
    }
    return snapshot;
}

FilesystemSnapshot parse_long_listing(const std::string& listing,
                                      const std::string& home_directory) {
    FilesystemSnapshot snapshot;
    const std::string home = strip_trailing_slash(home_directory);
    std::istringstream in(listing);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("total", 0) == 0) {
            continue;
        }
        const auto fields = split_fields(line);
        if (fields.size() < 9) {
            continue;
        }
        // Mode string: '-' is a regular file; drops directories, links, "." and "..".
        if (fields.front().empty() || fields.front().front() != '-') {
            continue;
        }
        snapshot.insert(home + "/" + fields.back());
    }
    return snapshot;
}

std::vector<std::string> compute_new_files(const FilesystemSnapshot& before,
                                           const FilesystemSnapshot& after,
                                           const std::vector<std::string>& excluded_patterns) {
    std::vector<std::string> added;
    std::set_difference(after.begin(), after.end(), before.begin(), before.end(),
                        std::back_inserter(added));

    std::vector<std::string> kept;
    for (const auto& path : added) {
        const bool noise = std::any_of(
            excluded_patterns.begin(), excluded_patterns.end(),
            [&path](const std::string& pattern) {
                return path.find(pattern) != std::string::npos;
            });
        if (noise) {
            LOG_DEBUG("Ignoring bookkeeping file: " + path);
            continue;
        }
        kept.push_back(path);
    }
    return kept;
}

SnapshotEngine::SnapshotEngine(const std::uint32_t depth, const std::uint32_t timeout_s)
    : depth_(depth), timeout_s_(timeout_s) {}

std::string SnapshotEngine::preferred_command(const std::string& home_directory) const {
    return "find " + sandbox::shell_quote(home_directory) + " -maxdepth " +
           std::to_string(depth_) + " -type f 2>/dev/null";
}

std::string SnapshotEngine::fallback_command(const std::string& home_directory) const {
    return "ls -la " + sandbox::shell_quote(home_directory);
}

FilesystemSnapshot SnapshotEngine::capture(sandbox::Sandbox& sandbox) const {
    const std::string home = sandbox.home_directory();
    const std::uint32_t timeout_ms = timeout_s_ * 1000;

    auto preferred = sandbox.run_command(preferred_command(home), timeout_ms);
    if (!core::errors::is_error(preferred)) {
        const auto& listing = core::errors::get_value(preferred);
        if (!listing.timed_out && listing.exit_code == 0) {
            return parse_path_listing(listing.stdout_text);
        }
        LOG_DEBUG("Path listing failed with exit code " +
                  std::to_string(listing.exit_code) + ", falling back to long listing");
    } else {
        LOG_DEBUG("Path listing failed: " + core::errors::get_error(preferred).message);
    }

    auto fallback = sandbox.run_command(fallback_command(home), timeout_ms);
    if (core::errors::is_error(fallback)) {
        LOG_WARN("Could not list files in " + home + ": " +
                 core::errors::get_error(fallback).message);
        return {};
    }
    const auto& listing = core::errors::get_value(fallback);
    if (listing.timed_out || listing.exit_code != 0) {
        LOG_WARN("Could not list files in " + home + ": listing exited with code " +
                 std::to_string(listing.exit_code));
        return {};
    }
    return parse_long_listing(listing.stdout_text, home);
}

}  // namespace codebox::runtime
