#pragma once

#include <memory>
#include <optional>
#include <string>
#include "core/errors/exec_errors.hpp"
#include "sandbox/sandbox.hpp"

namespace codebox::sandbox {

// Exclusive ownership of one sandbox for one request. Released exactly once:
// explicitly through release() or, failing that, by the destructor.
class SandboxLease {
public:
    explicit SandboxLease(std::unique_ptr<Sandbox> sandbox);
    ~SandboxLease();

    SandboxLease(SandboxLease&& other) noexcept;
    SandboxLease& operator=(SandboxLease&& other) noexcept;
    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    // Precondition: !released().
    Sandbox& sandbox() const;

    void release();
    bool released() const { return sandbox_ == nullptr; }

private:
    std::unique_ptr<Sandbox> sandbox_;
};

class SandboxLifecycleManager {
public:
    explicit SandboxLifecycleManager(SandboxProvider& provider);

    // Configuration error for an empty credential, provisioning error when the
    // provider rejects creation. No retries.
    core::errors::Result<SandboxLease> acquire(
        const std::optional<std::string>& credential) const;

private:
    SandboxProvider& provider_;
};

}  // namespace codebox::sandbox
