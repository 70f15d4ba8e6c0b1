#include "sandbox/local_process_sandbox.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "sandbox/process_runner.hpp"

namespace codebox::sandbox {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using nlohmann::json;

namespace {

constexpr char kDriverFile[] = "driver.py";

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (const char c : text) {
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

bool write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << text;
    return out.good();
}

// Converts the driver's results file into result values and the error text.
void read_driver_report(const std::filesystem::path& report_path, CodeOutcome& outcome,
                        bool& report_found) {
    std::ifstream in(report_path);
    if (!in.is_open()) {
        report_found = false;
        return;
    }
    const json report = json::parse(in, nullptr, false);
    if (report.is_discarded() || !report.is_object()) {
        report_found = false;
        return;
    }
    report_found = true;

    if (report.contains("results") && report.at("results").is_array()) {
        for (const auto& item : report.at("results")) {
            if (item.contains("png") && item.at("png").is_string()) {
                outcome.results.emplace_back(ImageValue{"png", item.at("png").get<std::string>()});
            } else if (item.contains("text") && item.at("text").is_string()) {
                outcome.results.emplace_back(TextValue{item.at("text").get<std::string>()});
            } else {
                outcome.results.emplace_back(EmptyValue{});
            }
        }
    }

    if (report.contains("error") && report.at("error").is_object()) {
        const auto& error = report.at("error");
        const std::string name = error.value("name", "Error");
        const std::string value = error.value("value", "");
        outcome.error = value.empty() ? name : name + ": " + value;
    }
}

}  // namespace

LocalProcessSandbox::LocalProcessSandbox(std::string id, std::filesystem::path root,
                                         LocalSandboxOptions options)
    : id_(std::move(id)),
      root_(std::move(root)),
      home_(root_ / "home"),
      runtime_dir_(root_ / ".runtime"),
      options_(std::move(options)),
      guard_(home_),
      cancel_token_(std::make_shared<std::atomic_bool>(false)) {}

LocalProcessSandbox::~LocalProcessSandbox() {
    if (!destroyed_.load()) {
        auto destroyed = destroy();
        if (core::errors::is_error(destroyed)) {
            LOG_WARN("Local sandbox " + id_ + " cleanup failed: " +
                     core::errors::get_error(destroyed).message);
        }
    }
}

core::errors::Result<bool> LocalProcessSandbox::ensure_live() const {
    if (destroyed_.load()) {
        return ExecError{ErrorCategory::Provider, "Sandbox " + id_ + " was already released.",
                         "sandbox_released"};
    }
    return true;
}

std::string LocalProcessSandbox::environment_prefix() const {
    return "HOME=" + shell_quote(home_.string()) + " MPLBACKEND=Agg ";
}

core::errors::Result<CodeOutcome> LocalProcessSandbox::run_code(const std::string& code,
                                                                const std::uint32_t timeout_s) {
    auto live = ensure_live();
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    const std::uint32_t cell = next_cell_++;
    const auto cell_path = runtime_dir_ / ("cell-" + std::to_string(cell) + ".src");
    const auto report_path = runtime_dir_ / ("cell-" + std::to_string(cell) + ".json");
    if (!write_text(cell_path, code)) {
        return ExecError{ErrorCategory::Provider,
                         "Unable to stage code in sandbox " + id_, "code_stage_failed"};
    }

    ProcessRequest request;
    request.working_directory = home_;
    request.timeout_ms = timeout_s * 1000;
    request.cancel_token = cancel_token_;
    if (options_.capture_result_values) {
        request.command = environment_prefix() + options_.interpreter + " " +
                          shell_quote((runtime_dir_ / kDriverFile).string()) + " " +
                          shell_quote(cell_path.string()) + " " +
                          shell_quote(report_path.string());
    } else {
        request.command = environment_prefix() + options_.interpreter + " " +
                          shell_quote(cell_path.string());
    }

    auto captured = run_process(request);
    std::error_code ec;
    std::filesystem::remove(cell_path, ec);
    if (core::errors::is_error(captured)) {
        const auto& err = core::errors::get_error(captured);
        return ExecError{ErrorCategory::Provider, "Sandbox transport failure: " + err.message,
                         err.code};
    }
    const auto& capture = core::errors::get_value(captured);
    if (capture.cancelled) {
        std::filesystem::remove(report_path, ec);
        return ExecError{ErrorCategory::Provider,
                         "Execution cancelled: sandbox " + id_ + " was released.",
                         "sandbox_released"};
    }

    CodeOutcome outcome;
    outcome.stdout_lines = split_lines(capture.stdout_text);
    outcome.stderr_lines = split_lines(capture.stderr_text);

    if (capture.timed_out) {
        outcome.error = "Execution timed out after " + std::to_string(timeout_s) + " seconds";
        std::filesystem::remove(report_path, ec);
        return outcome;
    }

    if (options_.capture_result_values) {
        bool report_found = false;
        read_driver_report(report_path, outcome, report_found);
        std::filesystem::remove(report_path, ec);
        if (!report_found && capture.exit_code != 0) {
            outcome.error = "Interpreter exited with code " + std::to_string(capture.exit_code);
        }
    } else if (capture.exit_code != 0) {
        outcome.error = "Process exited with code " + std::to_string(capture.exit_code);
    }
    return outcome;
}

core::errors::Result<CommandOutcome> LocalProcessSandbox::run_command(
    const std::string& command, const std::uint32_t timeout_ms) {
    auto live = ensure_live();
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }
    if (command.empty()) {
        return ExecError{ErrorCategory::Provider, "Command cannot be empty.", "empty_command"};
    }

    ProcessRequest request;
    request.command = environment_prefix() + command;
    request.working_directory = home_;
    request.timeout_ms = timeout_ms;
    request.cancel_token = cancel_token_;

    auto captured = run_process(request);
    if (core::errors::is_error(captured)) {
        const auto& err = core::errors::get_error(captured);
        return ExecError{ErrorCategory::Provider, "Sandbox transport failure: " + err.message,
                         err.code};
    }
    const auto& capture = core::errors::get_value(captured);
    if (capture.cancelled) {
        return ExecError{ErrorCategory::Provider,
                         "Command cancelled: sandbox " + id_ + " was released.",
                         "sandbox_released"};
    }

    CommandOutcome outcome;
    outcome.stdout_text = capture.stdout_text;
    outcome.stderr_text = capture.stderr_text;
    outcome.exit_code = capture.exit_code;
    outcome.timed_out = capture.timed_out;
    return outcome;
}

core::errors::Result<FileContent> LocalProcessSandbox::read_file(const std::string& path) {
    auto live = ensure_live();
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    auto resolved = guard_.resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ExecError{ErrorCategory::Provider, "File does not exist: " + path,
                         "file_not_found"};
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return ExecError{ErrorCategory::Provider, "Failed to open file: " + path,
                         "file_open_failed"};
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad()) {
        return ExecError{ErrorCategory::Provider, "I/O error while reading file: " + path,
                         "file_read_failed"};
    }
    return FileContent(std::move(bytes));
}

core::errors::Result<std::size_t> LocalProcessSandbox::write_file(
    const std::string& path, const std::vector<std::uint8_t>& bytes) {
    auto live = ensure_live();
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    auto resolved = guard_.resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& file_path = core::errors::get_value(resolved);

    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return ExecError{ErrorCategory::Provider,
                         "Unable to create directory for: " + path, "file_write_failed"};
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ExecError{ErrorCategory::Provider, "Failed to open file for writing: " + path,
                         "file_write_failed"};
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out.good()) {
        return ExecError{ErrorCategory::Provider, "I/O error while writing file: " + path,
                         "file_write_failed"};
    }
    return bytes.size();
}

core::errors::Result<bool> LocalProcessSandbox::destroy() {
    if (destroyed_.exchange(true)) {
        return false;
    }
    // Kills anything still running in this sandbox.
    cancel_token_->store(true);

    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec) {
        return ExecError{ErrorCategory::Provider,
                         "Unable to remove sandbox directory " + root_.string() + ": " +
                             ec.message(),
                         "sandbox_destroy_failed"};
    }
    return true;
}

LocalProcessSandboxProvider::LocalProcessSandboxProvider(LocalSandboxOptions options)
    : options_(std::move(options)) {}

core::errors::Result<std::unique_ptr<Sandbox>> LocalProcessSandboxProvider::create(
    const std::string& credential) {
    if (credential.empty()) {
        return ExecError{ErrorCategory::Provisioning, "Credential rejected: empty value.",
                         "invalid_credential"};
    }

    const std::string id = core::config::generate_request_id("sbx-");
    const auto root = options_.sandbox_root / ("codebox-" + id);

    std::error_code ec;
    std::filesystem::create_directories(root / "home", ec);
    if (!ec) {
        std::filesystem::create_directories(root / ".runtime", ec);
    }
    if (ec) {
        return ExecError{ErrorCategory::Provisioning,
                         "Unable to create sandbox directory " + root.string() + ": " +
                             ec.message(),
                         "sandbox_create_failed"};
    }

    if (options_.capture_result_values &&
        !write_text(root / ".runtime" / kDriverFile, python_driver_source())) {
        std::filesystem::remove_all(root, ec);
        return ExecError{ErrorCategory::Provisioning,
                         "Unable to install interpreter driver in " + root.string(),
                         "sandbox_create_failed"};
    }

    LOG_DEBUG("Local sandbox " + id + " created at " + root.string());
    return std::unique_ptr<Sandbox>(
        std::make_unique<LocalProcessSandbox>(id, root, options_));
}

const std::string& python_driver_source() {
    static const std::string source = R"PY(import ast
import base64
import io
import json
import sys
import traceback


def _render(value):
    png = getattr(value, "_repr_png_", None)
    if callable(png):
        try:
            data = png()
        except Exception:
            data = None
        if data:
            if isinstance(data, str):
                data = data.encode("latin-1")
            return {"png": base64.b64encode(data).decode("ascii")}
    return {"text": repr(value)}


def _figures():
    pyplot = sys.modules.get("matplotlib.pyplot")
    if pyplot is None:
        return []
    rendered = []
    for number in pyplot.get_fignums():
        buffer = io.BytesIO()
        pyplot.figure(number).savefig(buffer, format="png")
        rendered.append({"png": base64.b64encode(buffer.getvalue()).decode("ascii")})
    pyplot.close("all")
    return rendered


def main():
    cell_path, report_path = sys.argv[1], sys.argv[2]
    with open(cell_path, encoding="utf-8") as handle:
        source = handle.read()
    sys.argv = [cell_path]
    results = []
    error = None
    scope = {"__name__": "__main__"}
    try:
        tree = ast.parse(source, filename="<cell>")
        trailing = None
        if tree.body and isinstance(tree.body[-1], ast.Expr):
            trailing = ast.Expression(tree.body.pop().value)
        exec(compile(tree, "<cell>", "exec"), scope)
        value = None
        if trailing is not None:
            value = eval(compile(trailing, "<cell>", "eval"), scope)
        results.extend(_figures())
        if value is not None:
            results.append(_render(value))
    except SystemExit as exc:
        if exc.code not in (None, 0):
            error = {"name": "SystemExit", "value": str(exc.code)}
    except BaseException as exc:
        traceback.print_exc()
        error = {"name": type(exc).__name__, "value": str(exc)}
    finally:
        sys.stdout.flush()
        sys.stderr.flush()
        with open(report_path, "w", encoding="utf-8") as handle:
            json.dump({"results": results, "error": error}, handle)


if __name__ == "__main__":
    main()
)PY";
    return source;
}

}  // namespace codebox::sandbox
