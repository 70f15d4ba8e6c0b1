#include "runtime/artifact_retriever.hpp"

#include <filesystem>
#include <type_traits>
#include <unordered_set>
#include "core/encoding/base64.hpp"
#include "core/logging/logger.hpp"

namespace codebox::runtime {

std::string basename_of(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

std::vector<std::string> candidate_paths(const std::string& path,
                                         const std::string& home_directory) {
    const std::string filename = basename_of(path);
    std::string home = home_directory;
    while (home.size() > 1 && home.back() == '/') {
        home.pop_back();
    }

    std::vector<std::string> candidates;
    for (const auto& candidate : {path, home + "/" + filename, filename}) {
        if (candidate.empty()) {
            continue;
        }
        bool seen = false;
        for (const auto& existing : candidates) {
            seen = seen || existing == candidate;
        }
        if (!seen) {
            candidates.push_back(candidate);
        }
    }
    return candidates;
}

protocol::ArtifactRecord make_record(const std::string& filename,
                                     const sandbox::FileContent& content) {
    protocol::ArtifactRecord record;
    record.filename = filename;
    std::visit(
        [&record](const auto& payload) {
            // Text is already UTF-8 in a std::string; both forms are raw bytes here.
            record.size = payload.size();
            record.data = core::encoding::base64_encode(payload);
        },
        content);
    return record;
}

std::vector<protocol::ArtifactRecord> ArtifactRetriever::collect(
    sandbox::Sandbox& sandbox, const std::vector<std::string>& requested_paths,
    const std::vector<std::string>& new_files) const {
    std::vector<protocol::ArtifactRecord> files;
    std::unordered_set<std::string> collected_filenames;

    for (const auto& filepath : requested_paths) {
        const std::string filename = basename_of(filepath);
        if (filename.empty()) {
            LOG_WARN("Could not retrieve file " + filepath + ": path has no file name");
            continue;
        }
        auto read = sandbox.read_file(filepath);
        if (core::errors::is_error(read)) {
            LOG_WARN("Could not retrieve file " + filepath + ": " +
                     core::errors::get_error(read).message);
            continue;
        }
        files.push_back(make_record(filename, core::errors::get_value(read)));
        collected_filenames.insert(filename);
        LOG_INFO("Retrieved requested file: " + filepath + " (" +
                 std::to_string(files.back().size) + " bytes)");
    }

    const std::string home = sandbox.home_directory();
    for (const auto& filepath : new_files) {
        const std::string filename = basename_of(filepath);
        if (filename.empty() || collected_filenames.count(filename) > 0) {
            continue;
        }

        bool retrieved = false;
        for (const auto& try_path : candidate_paths(filepath, home)) {
            auto read = sandbox.read_file(try_path);
            if (core::errors::is_error(read)) {
                LOG_DEBUG("Candidate " + try_path + " unreadable: " +
                          core::errors::get_error(read).message);
                continue;
            }
            files.push_back(make_record(filename, core::errors::get_value(read)));
            collected_filenames.insert(filename);
            LOG_INFO("Retrieved auto-detected file: " + filename + " (" +
                     std::to_string(files.back().size) + " bytes)");
            retrieved = true;
            break;
        }
        if (!retrieved) {
            LOG_WARN("Could not retrieve auto-detected file " + filepath);
        }
    }
    return files;
}

}  // namespace codebox::runtime
