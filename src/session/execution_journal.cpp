#include "session/execution_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/request_codec.hpp"

namespace codebox::session {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json request_to_json(const protocol::ExecutionRequest& request, const std::string& mode) {
    json upload_names = json::array();
    for (const auto& upload : request.uploads) {
        upload_names.push_back(upload.filename);
    }

    json payload;
    payload["mode"] = mode;
    payload["code_length"] = request.code.size();
    payload["timeout"] = request.timeout_s;
    payload["dependencies"] = request.dependencies;
    payload["output_files"] = request.output_files;
    payload["uploads"] = upload_names;
    return payload;
}

json result_to_json(const protocol::ExecutionResult& result) {
    json file_names = json::array();
    for (const auto& file : result.files) {
        file_names.push_back(file.filename);
    }

    json payload;
    payload["success"] = result.success;
    payload["error"] = result.error.has_value() ? json(*result.error) : json(nullptr);
    payload["plots"] = result.plots.size();
    payload["files"] = file_names;
    payload["execution_time"] = result.execution_time_s;
    return payload;
}

json make_event(const std::string& name, const std::string& request_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = name;
    event["request_id"] = request_id;
    event["payload"] = std::move(payload);
    return event;
}

}  // namespace

ExecutionJournal::ExecutionJournal(std::filesystem::path journal_dir)
    : journal_dir_(std::move(journal_dir)) {}

core::errors::Result<std::filesystem::path> ExecutionJournal::journal_path(
    const std::string& request_id) const {
    if (request_id.empty()) {
        return ExecError{ErrorCategory::Input, "Request ID cannot be empty.",
                         "invalid_request_id"};
    }
    if (request_id.find('/') != std::string::npos || request_id == "." ||
        request_id == "..") {
        return ExecError{ErrorCategory::Input,
                         "Request ID is not a valid file name: " + request_id,
                         "invalid_request_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(journal_dir_, ec);
    if (ec) {
        return ExecError{ErrorCategory::Internal,
                         "Unable to create journal directory: " + journal_dir_.string(),
                         "journal_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(journal_dir_, ec) || ec) {
        return ExecError{ErrorCategory::Internal,
                         "Journal path is not a directory: " + journal_dir_.string(),
                         "journal_dir_create_failed"};
    }

    return journal_dir_ / (request_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> ExecutionJournal::append_event(
    const std::string& request_id, const std::string& event_json) const {
    auto path_result = journal_path(request_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto journal_file = core::errors::get_value(path_result);

    std::ofstream out(journal_file, std::ios::app);
    if (!out.is_open()) {
        return ExecError{ErrorCategory::Internal,
                         "Unable to open journal file: " + journal_file.string(),
                         "journal_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return ExecError{ErrorCategory::Internal,
                         "Unable to write journal event: " + journal_file.string(),
                         "journal_write_failed"};
    }

    return journal_file;
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_request(
    const std::string& request_id, const protocol::ExecutionRequest& request,
    const std::string& mode) const {
    const json event = make_event("request", request_id, request_to_json(request, mode));
    return append_event(request_id, protocol::dump_json(event, -1));
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_final(
    const std::string& request_id, const protocol::ExecutionResult& result) const {
    const json event = make_event("final", request_id, result_to_json(result));
    return append_event(request_id, protocol::dump_json(event, -1));
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_failure(
    const std::string& request_id, const core::errors::ExecError& error) const {
    json payload;
    payload["success"] = false;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["error"] = error.message;
    return append_event(request_id,
                        protocol::dump_json(make_event("final", request_id, payload), -1));
}

}  // namespace codebox::session
