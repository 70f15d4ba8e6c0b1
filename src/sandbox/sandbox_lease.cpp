#include "sandbox/sandbox_lease.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace codebox::sandbox {

using core::errors::ErrorCategory;
using core::errors::ExecError;

SandboxLease::SandboxLease(std::unique_ptr<Sandbox> sandbox)
    : sandbox_(std::move(sandbox)) {}

SandboxLease::~SandboxLease() { release(); }

SandboxLease::SandboxLease(SandboxLease&& other) noexcept
    : sandbox_(std::move(other.sandbox_)) {}

SandboxLease& SandboxLease::operator=(SandboxLease&& other) noexcept {
    if (this != &other) {
        release();
        sandbox_ = std::move(other.sandbox_);
    }
    return *this;
}

Sandbox& SandboxLease::sandbox() const { return *sandbox_; }

void SandboxLease::release() {
    if (!sandbox_) {
        return;
    }

    // Take ownership first so a second call is a no-op whatever destroy() does.
    std::unique_ptr<Sandbox> sandbox = std::move(sandbox_);
    const std::string sandbox_id = sandbox->id();
    try {
        auto destroyed = sandbox->destroy();
        if (core::errors::is_error(destroyed)) {
            LOG_WARN("Sandbox " + sandbox_id + " release reported an error: " +
                     core::errors::get_error(destroyed).message);
            return;
        }
        LOG_INFO("Sandbox " + sandbox_id + " released");
    } catch (const std::exception& e) {
        LOG_WARN("Sandbox " + sandbox_id + " release threw: " + e.what());
    }
}

SandboxLifecycleManager::SandboxLifecycleManager(SandboxProvider& provider)
    : provider_(provider) {}

core::errors::Result<SandboxLease> SandboxLifecycleManager::acquire(
    const std::optional<std::string>& credential) const {
    if (!credential.has_value() || credential->empty()) {
        return ExecError{
            ErrorCategory::Configuration, "Sandbox credential not configured.",
            "missing_credential",
            "Set CODEBOX_API_KEY, the 'default_credential' config key, or pass "
            "a per-request credential."};
    }

    auto created = provider_.create(*credential);
    if (core::errors::is_error(created)) {
        const auto& err = core::errors::get_error(created);
        LOG_ERROR("Sandbox provisioning failed [" + err.code + "]: " + err.message);
        return ExecError{ErrorCategory::Provisioning,
                         "Sandbox could not be created: " + err.message,
                         "sandbox_provisioning_failed"};
    }

    std::unique_ptr<Sandbox> sandbox = core::errors::take_value(created);
    if (!sandbox) {
        return ExecError{ErrorCategory::Provisioning,
                         "Sandbox provider returned no sandbox.",
                         "sandbox_provisioning_failed"};
    }
    LOG_INFO("Sandbox " + sandbox->id() + " acquired");
    return SandboxLease(std::move(sandbox));
}

}  // namespace codebox::sandbox
