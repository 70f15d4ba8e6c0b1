#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "sandbox/path_guard.hpp"
#include "sandbox/sandbox.hpp"

namespace codebox::sandbox {

struct LocalSandboxOptions {
    std::filesystem::path sandbox_root = std::filesystem::temp_directory_path();
    std::string interpreter = "python3";
    // Run code through the notebook-style driver (trailing expression, figures).
    bool capture_result_values = true;
};

// A sandbox backed by a private directory tree and child processes of this host:
//   <root>/home      working and home directory of the code
//   <root>/.runtime  driver script and per-cell scratch files
class LocalProcessSandbox : public Sandbox {
public:
    LocalProcessSandbox(std::string id, std::filesystem::path root,
                        LocalSandboxOptions options);
    ~LocalProcessSandbox() override;

    const std::string& id() const override { return id_; }
    std::string home_directory() const override { return home_.string(); }

    core::errors::Result<CodeOutcome> run_code(const std::string& code,
                                               std::uint32_t timeout_s) override;
    core::errors::Result<CommandOutcome> run_command(const std::string& command,
                                                     std::uint32_t timeout_ms) override;
    core::errors::Result<FileContent> read_file(const std::string& path) override;
    core::errors::Result<std::size_t> write_file(
        const std::string& path, const std::vector<std::uint8_t>& bytes) override;
    core::errors::Result<bool> destroy() override;

private:
    core::errors::Result<bool> ensure_live() const;
    std::string environment_prefix() const;

    std::string id_;
    std::filesystem::path root_;
    std::filesystem::path home_;
    std::filesystem::path runtime_dir_;
    LocalSandboxOptions options_;
    PathGuard guard_;
    std::shared_ptr<std::atomic_bool> cancel_token_;
    std::atomic_bool destroyed_{false};
    std::uint32_t next_cell_ = 1;
};

class LocalProcessSandboxProvider : public SandboxProvider {
public:
    explicit LocalProcessSandboxProvider(LocalSandboxOptions options = {});

    core::errors::Result<std::unique_ptr<Sandbox>> create(
        const std::string& credential) override;

private:
    LocalSandboxOptions options_;
};

// Python source of the notebook-style driver, exposed for inspection in tests.
const std::string& python_driver_source();

}  // namespace codebox::sandbox
