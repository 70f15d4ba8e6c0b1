#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/errors/exec_errors.hpp"
#include "sandbox/sandbox.hpp"

namespace codebox::testing {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using core::errors::Result;
using sandbox::CodeOutcome;
using sandbox::CommandOutcome;
using sandbox::FileContent;

// Everything a scripted sandbox does, kept alive after the sandbox is destroyed.
struct FakeSandboxState {
    std::string home = "/home/user";
    std::map<std::string, FileContent> files;
    std::set<std::string> unreadable;

    std::function<Result<CodeOutcome>(FakeSandboxState&, const std::string&)> on_run_code;
    std::function<Result<CommandOutcome>(FakeSandboxState&, const std::string&)> on_command;

    std::vector<std::string> commands;
    std::vector<std::string> reads;
    std::vector<std::string> writes;
    int code_runs = 0;
    int destroy_calls = 0;
    std::optional<ExecError> destroy_error;
    bool destroy_throws = false;
    std::uint32_t last_timeout_s = 0;

    void put_text(const std::string& path, const std::string& text) { files[path] = text; }

    std::string find_listing() const {
        std::string listing;
        for (const auto& entry : files) {
            if (entry.first.rfind(home + "/", 0) == 0) {
                listing += entry.first + "\n";
            }
        }
        return listing;
    }
};

class FakeSandbox : public sandbox::Sandbox {
public:
    explicit FakeSandbox(std::shared_ptr<FakeSandboxState> state)
        : state_(std::move(state)) {}

    const std::string& id() const override { return id_; }
    std::string home_directory() const override { return state_->home; }

    Result<CodeOutcome> run_code(const std::string& code, std::uint32_t timeout_s) override {
        ++state_->code_runs;
        state_->last_timeout_s = timeout_s;
        if (state_->on_run_code) {
            return state_->on_run_code(*state_, code);
        }
        return CodeOutcome{};
    }

    Result<CommandOutcome> run_command(const std::string& command, std::uint32_t) override {
        state_->commands.push_back(command);
        if (state_->on_command) {
            return state_->on_command(*state_, command);
        }
        CommandOutcome outcome;
        if (command.rfind("find ", 0) == 0) {
            outcome.stdout_text = state_->find_listing();
            outcome.exit_code = 0;
        } else if (command.rfind("ls ", 0) == 0) {
            outcome.exit_code = 2;
        } else {
            outcome.stdout_text = "Successfully installed";
            outcome.exit_code = 0;
        }
        return outcome;
    }

    Result<FileContent> read_file(const std::string& path) override {
        state_->reads.push_back(path);
        const auto it = state_->files.find(path);
        if (it == state_->files.end() || state_->unreadable.count(path) > 0) {
            return ExecError{ErrorCategory::Provider, "File does not exist: " + path,
                             "file_not_found"};
        }
        return it->second;
    }

    Result<std::size_t> write_file(const std::string& path,
                                   const std::vector<std::uint8_t>& bytes) override {
        state_->writes.push_back(path);
        const std::string full = path.rfind('/', 0) == 0 ? path : state_->home + "/" + path;
        state_->files[full] = bytes;
        return bytes.size();
    }

    Result<bool> destroy() override {
        ++state_->destroy_calls;
        if (state_->destroy_throws) {
            throw std::runtime_error("connection reset");
        }
        if (state_->destroy_error.has_value()) {
            return *state_->destroy_error;
        }
        return true;
    }

private:
    std::string id_ = "sbx-fake";
    std::shared_ptr<FakeSandboxState> state_;
};

class FakeProvider : public sandbox::SandboxProvider {
public:
    Result<std::unique_ptr<sandbox::Sandbox>> create(const std::string& credential) override {
        credentials.push_back(credential);
        if (create_error.has_value()) {
            return *create_error;
        }
        return std::unique_ptr<sandbox::Sandbox>(std::make_unique<FakeSandbox>(state));
    }

    std::shared_ptr<FakeSandboxState> state = std::make_shared<FakeSandboxState>();
    std::optional<ExecError> create_error;
    std::vector<std::string> credentials;
};

// Code handler that prints lines and optionally creates files in the home directory.
inline std::function<Result<CodeOutcome>(FakeSandboxState&, const std::string&)> prints(
    std::vector<std::string> lines,
    std::map<std::string, std::string> created_files = {}) {
    return [lines, created_files](FakeSandboxState& state,
                                  const std::string&) -> Result<CodeOutcome> {
        for (const auto& file : created_files) {
            state.put_text(file.first, file.second);
        }
        CodeOutcome outcome;
        outcome.stdout_lines = lines;
        return outcome;
    };
}

}  // namespace codebox::testing
