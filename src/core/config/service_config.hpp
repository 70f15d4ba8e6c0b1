#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/exec_errors.hpp"
#include "core/logging/logger.hpp"

namespace codebox::core::config {

// Process-wide settings. Defaults, then the JSON config file, then environment.
struct ServiceConfig {
    std::string default_credential;
    std::filesystem::path sandbox_root = std::filesystem::temp_directory_path();
    std::string interpreter = "python3";
    bool capture_result_values = true;

    std::string install_command = "pip install -q";
    std::uint32_t install_timeout_s = 60;

    std::uint32_t listing_timeout_s = 10;
    std::uint32_t listing_depth = 2;
    std::vector<std::string> excluded_patterns = {
        ".pyc", "__pycache__", ".ipynb_checkpoints", ".cache"};

    std::uint32_t default_timeout_s = 30;
    std::uint32_t max_timeout_s = 600;

    std::optional<std::filesystem::path> journal_dir;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

constexpr std::uint32_t kMaxListingTimeoutSeconds = 10;

// Applies a JSON document on top of `base`. Unknown keys are ignored.
errors::Result<ServiceConfig> apply_config_json(ServiceConfig base,
                                                const std::string& json_text);

// Applies CODEBOX_* environment variables on top of `base`.
errors::Result<ServiceConfig> apply_environment(ServiceConfig base);

// Full load: defaults, optional file, environment.
errors::Result<ServiceConfig> load_service_config(
    const std::optional<std::filesystem::path>& config_file);

}  // namespace codebox::core::config
