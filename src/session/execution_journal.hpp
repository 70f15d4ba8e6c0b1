#pragma once

#include <filesystem>
#include <string>
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_request.hpp"
#include "protocol/execution_result.hpp"

namespace codebox::session {

// Append-only JSON-lines audit log, one file per request:
//   <journal_dir>/<request_id>.jsonl
// Never records the code text or the credential.
class ExecutionJournal {
public:
    explicit ExecutionJournal(std::filesystem::path journal_dir);

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& request_id, const protocol::ExecutionRequest& request,
        const std::string& mode) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& request_id, const protocol::ExecutionResult& result) const;

    core::errors::Result<std::filesystem::path> write_failure(
        const std::string& request_id, const core::errors::ExecError& error) const;

    core::errors::Result<std::filesystem::path> journal_path(
        const std::string& request_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& request_id, const std::string& event_json) const;

    std::filesystem::path journal_dir_;
};

}  // namespace codebox::session
