#include "protocol/request_codec.hpp"

#include <filesystem>
#include <utility>
#include "core/encoding/base64.hpp"

namespace codebox::protocol {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using nlohmann::json;

namespace {

ExecError invalid_request(const std::string& message) {
    return ExecError{ErrorCategory::Input, message, "invalid_request"};
}

core::errors::Result<std::vector<std::string>> read_string_array(const json& doc,
                                                                 const char* key) {
    std::vector<std::string> values;
    if (!doc.contains(key) || doc.at(key).is_null()) {
        return values;
    }
    const auto& array = doc.at(key);
    if (!array.is_array()) {
        return invalid_request(std::string("'") + key + "' must be an array of strings.");
    }
    for (const auto& item : array) {
        if (!item.is_string()) {
            return invalid_request(std::string("'") + key + "' must be an array of strings.");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

core::errors::Result<std::vector<UploadedFile>> read_uploads(const json& doc) {
    std::vector<UploadedFile> uploads;
    if (!doc.contains("uploads") || doc.at("uploads").is_null()) {
        return uploads;
    }
    const auto& array = doc.at("uploads");
    if (!array.is_array()) {
        return invalid_request("'uploads' must be an array of objects.");
    }
    for (const auto& item : array) {
        if (!item.is_object() || !item.contains("filename") || !item.contains("data") ||
            !item.at("filename").is_string() || !item.at("data").is_string()) {
            return invalid_request("Each upload needs string 'filename' and 'data' fields.");
        }

        const std::string filename =
            std::filesystem::path(item.at("filename").get<std::string>()).filename().string();
        if (filename.empty() || filename == "." || filename == "..") {
            return invalid_request("Upload filename is not a valid file name.");
        }

        auto bytes = core::encoding::base64_decode(item.at("data").get<std::string>());
        if (!bytes.has_value()) {
            return invalid_request("Upload '" + filename + "' is not valid base64.");
        }
        uploads.push_back(UploadedFile{filename, std::move(*bytes)});
    }
    return uploads;
}

}  // namespace

core::errors::Result<ExecutionRequest> parse_execution_request(
    const std::string& json_text, const RequestLimits& limits) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return invalid_request("Request must be a JSON object.");
    }

    ExecutionRequest request;
    if (!doc.contains("code") || !doc.at("code").is_string()) {
        return invalid_request("'code' is required and must be a string.");
    }
    request.code = doc.at("code").get<std::string>();
    if (request.code.empty()) {
        return invalid_request("'code' cannot be empty.");
    }

    request.timeout_s = limits.default_timeout_s;
    if (doc.contains("timeout") && !doc.at("timeout").is_null()) {
        const auto& timeout = doc.at("timeout");
        if (!timeout.is_number_integer() || timeout.get<std::int64_t>() <= 0) {
            return invalid_request("'timeout' must be a positive integer (seconds).");
        }
        if (timeout.get<std::int64_t>() > static_cast<std::int64_t>(limits.max_timeout_s)) {
            return invalid_request("'timeout' exceeds the maximum of " +
                                   std::to_string(limits.max_timeout_s) + " seconds.");
        }
        request.timeout_s = static_cast<std::uint32_t>(timeout.get<std::int64_t>());
    }

    auto dependencies = read_string_array(doc, "dependencies");
    if (core::errors::is_error(dependencies)) {
        return core::errors::get_error(dependencies);
    }
    request.dependencies = core::errors::take_value(dependencies);

    auto output_files = read_string_array(doc, "output_files");
    if (core::errors::is_error(output_files)) {
        return core::errors::get_error(output_files);
    }
    request.output_files = core::errors::take_value(output_files);

    auto uploads = read_uploads(doc);
    if (core::errors::is_error(uploads)) {
        return core::errors::get_error(uploads);
    }
    request.uploads = core::errors::take_value(uploads);

    return request;
}

json to_json(const ExecutionResult& result) {
    json plots = json::array();
    for (const auto& plot : result.plots) {
        plots.push_back({{"format", plot.format}, {"data", plot.data}});
    }

    json files = json::array();
    for (const auto& file : result.files) {
        files.push_back(
            {{"filename", file.filename}, {"data", file.data}, {"size", file.size}});
    }

    json payload;
    payload["success"] = result.success;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["error"] = result.error.has_value() ? json(*result.error) : json(nullptr);
    payload["plots"] = plots;
    payload["files"] = files;
    payload["execution_time"] = result.execution_time_s;
    payload["install_output"] = result.install_output;
    return payload;
}

std::string dump_json(const json& payload, const int indent) {
    return payload.dump(indent, ' ', false, json::error_handler_t::replace);
}

json to_json(const HealthStatus& health) {
    json payload;
    payload["status"] = health.status;
    payload["service"] = health.service;
    payload["credential_configured"] = health.credential_configured;
    return payload;
}

}  // namespace codebox::protocol
