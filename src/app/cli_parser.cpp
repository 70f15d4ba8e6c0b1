#include "cli_parser.hpp"
#include <charconv>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include "protocol/request_codec.hpp"

namespace codebox::app::cli {

    using namespace codebox::core::errors;
    using codebox::protocol::ExecutionRequest;

    namespace {

        constexpr std::uint32_t kMaxCliTimeoutSeconds = 86400;

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> code;
            std::optional<std::string> code_file;
            std::optional<std::string> request_file;
            std::optional<std::string> timeout;
            std::vector<std::string> dependencies;
            std::vector<std::string> output_files;
            std::vector<std::string> uploads;
            std::optional<std::string> api_key;
            std::optional<std::string> config_file;
            bool basic = false;
        };

        Result<std::filesystem::path> existing_file(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return ExecError{ErrorCategory::Input, flag + " does not name a readable file: " + raw, "invalid_path"};
            }
            return p;
        }

        Result<std::string> read_whole_file(const std::filesystem::path& path) {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open()) {
                return ExecError{ErrorCategory::Input, "Unable to open file: " + path.string(), "invalid_path"};
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            return buffer.str();
        }

    }  // namespace

    Result<CliInvocation> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ExecError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: codebox run --code \"...\" | codebox health"};
        }

        CliInvocation invocation;
        std::string command = argv[1];
        if (command == "run") {
            invocation.command = CliCommand::Run;
        } else if (command == "health") {
            invocation.command = CliCommand::Health;
        } else {
            return ExecError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: run, health."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const bool is_run = invocation.command == CliCommand::Run;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            const bool takes_value = flag == "--code" || flag == "--code-file" || flag == "--request-file" ||
                                     flag == "--timeout" || flag == "--dep" || flag == "--output" ||
                                     flag == "--upload" || flag == "--api-key" || flag == "--config";
            const bool run_only = flag != "--api-key" && flag != "--config";
            if ((!takes_value && flag != "--basic") || (run_only && !is_run)) {
                return ExecError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
            if (flag == "--basic") {
                raw.basic = true;
                continue;
            }
            if (i + 1 >= args.size()) {
                return ExecError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            const std::string& value = args[++i];

            if (flag == "--code") raw.code = value;
            else if (flag == "--code-file") raw.code_file = value;
            else if (flag == "--request-file") raw.request_file = value;
            else if (flag == "--timeout") raw.timeout = value;
            else if (flag == "--dep") raw.dependencies.push_back(value);
            else if (flag == "--output") raw.output_files.push_back(value);
            else if (flag == "--upload") raw.uploads.push_back(value);
            else if (flag == "--api-key") raw.api_key = value;
            else if (flag == "--config") raw.config_file = value;
        }

        // 3. Validator Phase: Enforce logic and bounds
        invocation.api_key = raw.api_key;
        if (raw.config_file) {
            auto config_path = existing_file(raw.config_file.value(), "--config");
            if (is_error(config_path)) return get_error(config_path);
            invocation.config_file = get_value(config_path);
        }
        if (!is_run) {
            return invocation;
        }

        // Exactly one source of code
        const int sources = (raw.code ? 1 : 0) + (raw.code_file ? 1 : 0) + (raw.request_file ? 1 : 0);
        if (sources == 0) {
            return ExecError{ErrorCategory::Input, "Must provide one of --code, --code-file or --request-file", "missing_required_flag"};
        }
        if (sources > 1) {
            return ExecError{ErrorCategory::Input, "Provide only one of --code, --code-file or --request-file", "conflicting_flags"};
        }
        if (raw.request_file && (raw.timeout || !raw.dependencies.empty() || !raw.output_files.empty() || !raw.uploads.empty())) {
            return ExecError{ErrorCategory::Input, "--request-file cannot be combined with request flags", "conflicting_flags", "Put timeout, dependencies, output files and uploads in the request file."};
        }
        if (raw.code && raw.code->empty()) {
            return ExecError{ErrorCategory::Input, "--code cannot be empty", "missing_value"};
        }

        invocation.code = raw.code;
        invocation.basic = raw.basic;
        invocation.dependencies = raw.dependencies;
        invocation.output_files = raw.output_files;

        if (raw.code_file) {
            auto path = existing_file(raw.code_file.value(), "--code-file");
            if (is_error(path)) return get_error(path);
            invocation.code_file = get_value(path);
        }
        if (raw.request_file) {
            auto path = existing_file(raw.request_file.value(), "--request-file");
            if (is_error(path)) return get_error(path);
            invocation.request_file = get_value(path);
        }
        for (const auto& upload : raw.uploads) {
            auto path = existing_file(upload, "--upload");
            if (is_error(path)) return get_error(path);
            invocation.uploads.push_back(get_value(path));
        }

        // Exception-free integer parsing
        if (raw.timeout) {
            uint32_t seconds = 0;
            const char* begin = raw.timeout->data();
            const char* end = raw.timeout->data() + raw.timeout->size();
            auto [ptr, ec] = std::from_chars(begin, end, seconds);
            if (ec != std::errc() || ptr != end) {
                return ExecError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_integer", "Provide a positive integer number of seconds."};
            }
            if (seconds == 0 || seconds > kMaxCliTimeoutSeconds) {
                return ExecError{ErrorCategory::Input, "--timeout out of bounds", "bounds_error", "Must be between 1 and 86400."};
            }
            invocation.timeout_s = seconds;
        }

        return invocation;
    }

    Result<ExecutionRequest> build_request(const CliInvocation& invocation,
                                           const codebox::core::config::ServiceConfig& config) {
        if (invocation.request_file) {
            auto text = read_whole_file(invocation.request_file.value());
            if (is_error(text)) return get_error(text);
            return codebox::protocol::parse_execution_request(
                get_value(text), {config.default_timeout_s, config.max_timeout_s});
        }

        ExecutionRequest request;
        if (invocation.code_file) {
            auto text = read_whole_file(invocation.code_file.value());
            if (is_error(text)) return get_error(text);
            request.code = get_value(text);
        } else if (invocation.code) {
            request.code = invocation.code.value();
        }
        if (request.code.empty()) {
            return ExecError{ErrorCategory::Input, "Code cannot be empty.", "invalid_request"};
        }

        request.timeout_s = invocation.timeout_s.value_or(config.default_timeout_s);
        if (request.timeout_s > config.max_timeout_s) {
            return ExecError{ErrorCategory::Input, "--timeout out of bounds", "bounds_error",
                             "Must not exceed " + std::to_string(config.max_timeout_s) + " seconds."};
        }
        request.dependencies = invocation.dependencies;
        request.output_files = invocation.output_files;

        for (const auto& upload_path : invocation.uploads) {
            auto bytes = read_whole_file(upload_path);
            if (is_error(bytes)) return get_error(bytes);
            const std::string& content = get_value(bytes);
            request.uploads.push_back(codebox::protocol::UploadedFile{
                upload_path.filename().string(),
                std::vector<std::uint8_t>(content.begin(), content.end())});
        }
        return request;
    }

} // namespace codebox::app::cli
