#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_request.hpp"
#include "protocol/execution_result.hpp"

namespace codebox::protocol {

struct RequestLimits {
    std::uint32_t default_timeout_s = 30;
    std::uint32_t max_timeout_s = 600;
};

// Schema validation of a JSON execution request. Uploads carry base64 "data".
core::errors::Result<ExecutionRequest> parse_execution_request(
    const std::string& json_text, const RequestLimits& limits = {});

nlohmann::json to_json(const ExecutionResult& result);
nlohmann::json to_json(const HealthStatus& health);

// Serializes with invalid UTF-8 replaced by U+FFFD. Output of sandboxed code is
// arbitrary bytes, and dump() would throw on it. indent -1 gives one line.
std::string dump_json(const nlohmann::json& payload, int indent = 2);

}  // namespace codebox::protocol
