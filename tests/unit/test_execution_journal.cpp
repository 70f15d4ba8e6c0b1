#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/request_id.hpp"
#include "session/execution_journal.hpp"

namespace {

using codebox::core::errors::ErrorCategory;
using codebox::core::errors::ExecError;
using codebox::core::errors::get_error;
using codebox::core::errors::get_value;
using codebox::core::errors::is_error;
using codebox::protocol::ArtifactRecord;
using codebox::protocol::ExecutionRequest;
using codebox::protocol::ExecutionResult;
using codebox::protocol::UploadedFile;
using codebox::session::ExecutionJournal;

class TempWorkspace {
public:
    TempWorkspace()
        : root_(std::filesystem::current_path() /
                (".tmp_execution_journal_" + codebox::core::config::generate_request_id())) {}

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<nlohmann::json> read_events(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<nlohmann::json> events;
    std::string line;
    while (std::getline(in, line)) {
        events.push_back(nlohmann::json::parse(line));
    }
    return events;
}

TEST(ExecutionJournalTest, RejectsUnsafeRequestIds) {
    TempWorkspace workspace;
    ExecutionJournal journal(workspace.root());

    for (const std::string id : {"", "..", "a/b"}) {
        auto path = journal.journal_path(id);
        ASSERT_TRUE(is_error(path)) << id;
        EXPECT_EQ(get_error(path).code, "invalid_request_id");
    }
}

TEST(ExecutionJournalTest, WritesRequestAndFinalEvents) {
    TempWorkspace workspace;
    ExecutionJournal journal(workspace.root());

    ExecutionRequest request;
    request.code = "secret_token = 'abc'\nprint(1)";
    request.timeout_s = 12;
    request.dependencies = {"numpy"};
    request.output_files = {"out.csv"};
    request.uploads.push_back(UploadedFile{"data.csv", {'x'}});

    auto written = journal.write_request("req-0001", request, "advanced");
    ASSERT_FALSE(is_error(written));

    ExecutionResult result;
    result.success = true;
    result.files.push_back(ArtifactRecord{"out.csv", "eA==", 1});
    result.execution_time_s = 0.5;
    ASSERT_FALSE(is_error(journal.write_final("req-0001", result)));

    const auto events = read_events(get_value(written));
    ASSERT_EQ(events.size(), 2u);

    EXPECT_EQ(events[0].at("event"), "request");
    EXPECT_EQ(events[0].at("request_id"), "req-0001");
    const auto& request_payload = events[0].at("payload");
    EXPECT_EQ(request_payload.at("mode"), "advanced");
    EXPECT_EQ(request_payload.at("code_length"), request.code.size());
    EXPECT_EQ(request_payload.at("timeout"), 12);
    EXPECT_EQ(request_payload.at("uploads")[0], "data.csv");
    EXPECT_EQ(events[0].dump().find("secret_token"), std::string::npos);

    EXPECT_EQ(events[1].at("event"), "final");
    EXPECT_TRUE(events[1].at("payload").at("success").get<bool>());
    EXPECT_EQ(events[1].at("payload").at("files")[0], "out.csv");
    EXPECT_TRUE(events[1].at("ts_unix_ms").is_number_integer());
}

TEST(ExecutionJournalTest, WritesFailureEvent) {
    TempWorkspace workspace;
    ExecutionJournal journal(workspace.root());

    auto written = journal.write_failure(
        "req-0002", ExecError{ErrorCategory::Configuration, "Sandbox credential not configured.",
                              "missing_credential"});
    ASSERT_FALSE(is_error(written));

    const auto events = read_events(get_value(written));
    ASSERT_EQ(events.size(), 1u);
    const auto& payload = events[0].at("payload");
    EXPECT_FALSE(payload.at("success").get<bool>());
    EXPECT_EQ(payload.at("category"), "configuration");
    EXPECT_EQ(payload.at("code"), "missing_credential");
}

TEST(ExecutionJournalTest, RecordsResultWithInvalidUtf8) {
    TempWorkspace workspace;
    ExecutionJournal journal(workspace.root());

    ExecutionResult result;
    result.error = "UnicodeDecodeError: \xe9";
    result.files.push_back(ArtifactRecord{"caf\xe9.txt", "", 0});
    auto written = journal.write_final("req-0003", result);
    ASSERT_FALSE(is_error(written));

    auto failed = journal.write_failure(
        "req-0003", ExecError{ErrorCategory::Provider, "Sandbox execution failed: \xff",
                              "sandbox_execution_failed"});
    ASSERT_FALSE(is_error(failed));

    const auto events = read_events(get_value(written));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].at("payload").at("files")[0], "caf\xef\xbf\xbd.txt");
}

}  // namespace
