#pragma once

#include <optional>
#include <string>

namespace codebox::session {

// Per-request value beats the process-wide default. std::nullopt means no
// credential is available. Values are whitespace-trimmed first.
std::optional<std::string> resolve_credential(
    const std::optional<std::string>& per_request_value,
    const std::string& process_default);

}  // namespace codebox::session
