#include "core/config/service_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace codebox::core::config {

using errors::ErrorCategory;
using errors::ExecError;
using nlohmann::json;

namespace {

ExecError invalid_config(const std::string& message) {
    return ExecError{ErrorCategory::Input, message, "invalid_config",
                     "Check the codebox configuration file and CODEBOX_* variables."};
}

std::optional<std::string> read_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// Reads a positive integer field into `target`; leaves it untouched when absent.
std::optional<ExecError> read_positive(const json& doc, const char* key,
                                       std::uint32_t& target) {
    if (!doc.contains(key)) {
        return std::nullopt;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_integer() || value.get<std::int64_t>() <= 0 ||
        value.get<std::int64_t>() > 86400) {
        return invalid_config(std::string("'") + key +
                              "' must be a positive integer number of seconds or levels.");
    }
    target = static_cast<std::uint32_t>(value.get<std::int64_t>());
    return std::nullopt;
}

std::optional<ExecError> read_string(const json& doc, const char* key,
                                     std::string& target) {
    if (!doc.contains(key)) {
        return std::nullopt;
    }
    if (!doc.at(key).is_string()) {
        return invalid_config(std::string("'") + key + "' must be a string.");
    }
    target = doc.at(key).get<std::string>();
    return std::nullopt;
}

std::optional<ExecError> validate(const ServiceConfig& config) {
    if (config.listing_timeout_s > kMaxListingTimeoutSeconds) {
        return invalid_config("'listing_timeout_s' must not exceed 10 seconds.");
    }
    if (config.default_timeout_s > config.max_timeout_s) {
        return invalid_config("'default_timeout_s' must not exceed 'max_timeout_s'.");
    }
    if (config.interpreter.empty()) {
        return invalid_config("'interpreter' cannot be empty.");
    }
    if (config.install_command.empty()) {
        return invalid_config("'install_command' cannot be empty.");
    }
    return std::nullopt;
}

}  // namespace

errors::Result<ServiceConfig> apply_config_json(ServiceConfig base,
                                                const std::string& json_text) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return invalid_config("Configuration must be a JSON object.");
    }

    std::optional<ExecError> err;
    if ((err = read_string(doc, "default_credential", base.default_credential))) return *err;
    if ((err = read_string(doc, "interpreter", base.interpreter))) return *err;
    if ((err = read_string(doc, "install_command", base.install_command))) return *err;
    if ((err = read_positive(doc, "install_timeout_s", base.install_timeout_s))) return *err;
    if ((err = read_positive(doc, "listing_timeout_s", base.listing_timeout_s))) return *err;
    if ((err = read_positive(doc, "listing_depth", base.listing_depth))) return *err;
    if ((err = read_positive(doc, "default_timeout_s", base.default_timeout_s))) return *err;
    if ((err = read_positive(doc, "max_timeout_s", base.max_timeout_s))) return *err;

    std::string sandbox_root;
    if ((err = read_string(doc, "sandbox_root", sandbox_root))) return *err;
    if (!sandbox_root.empty()) {
        base.sandbox_root = sandbox_root;
    }

    std::string journal_dir;
    if ((err = read_string(doc, "journal_dir", journal_dir))) return *err;
    if (!journal_dir.empty()) {
        base.journal_dir = std::filesystem::path(journal_dir);
    }

    if (doc.contains("capture_result_values")) {
        if (!doc.at("capture_result_values").is_boolean()) {
            return invalid_config("'capture_result_values' must be a boolean.");
        }
        base.capture_result_values = doc.at("capture_result_values").get<bool>();
    }

    if (doc.contains("excluded_patterns")) {
        const auto& patterns = doc.at("excluded_patterns");
        if (!patterns.is_array()) {
            return invalid_config("'excluded_patterns' must be an array of strings.");
        }
        std::vector<std::string> parsed;
        for (const auto& pattern : patterns) {
            if (!pattern.is_string() || pattern.get<std::string>().empty()) {
                return invalid_config("'excluded_patterns' must be an array of strings.");
            }
            parsed.push_back(pattern.get<std::string>());
        }
        base.excluded_patterns = std::move(parsed);
    }

    std::string level_text;
    if ((err = read_string(doc, "log_level", level_text))) return *err;
    if (!level_text.empty()) {
        const auto level = logging::parse_log_level(level_text);
        if (!level.has_value()) {
            return invalid_config("Unknown log level: " + level_text);
        }
        base.log_level = *level;
    }

    if ((err = validate(base))) return *err;
    return base;
}

errors::Result<ServiceConfig> apply_environment(ServiceConfig base) {
    if (const auto key = read_env("CODEBOX_API_KEY")) {
        base.default_credential = *key;
    }
    if (const auto root = read_env("CODEBOX_SANDBOX_ROOT"); root && !root->empty()) {
        base.sandbox_root = *root;
    }
    if (const auto interpreter = read_env("CODEBOX_INTERPRETER");
        interpreter && !interpreter->empty()) {
        base.interpreter = *interpreter;
    }
    if (const auto install = read_env("CODEBOX_INSTALL_COMMAND");
        install && !install->empty()) {
        base.install_command = *install;
    }
    if (const auto journal = read_env("CODEBOX_JOURNAL_DIR"); journal && !journal->empty()) {
        base.journal_dir = std::filesystem::path(*journal);
    }
    if (const auto level_text = read_env("CODEBOX_LOG_LEVEL");
        level_text && !level_text->empty()) {
        const auto level = logging::parse_log_level(*level_text);
        if (!level.has_value()) {
            return invalid_config("Unknown log level in CODEBOX_LOG_LEVEL: " + *level_text);
        }
        base.log_level = *level;
    }

    if (const auto err = validate(base)) return *err;
    return base;
}

errors::Result<ServiceConfig> load_service_config(
    const std::optional<std::filesystem::path>& config_file) {
    ServiceConfig config;

    if (config_file.has_value()) {
        std::ifstream in(*config_file);
        if (!in.is_open()) {
            return invalid_config("Unable to open config file: " + config_file->string());
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();

        auto applied = apply_config_json(std::move(config), buffer.str());
        if (errors::is_error(applied)) {
            return errors::get_error(applied);
        }
        config = errors::take_value(applied);
    }

    return apply_environment(std::move(config));
}

}  // namespace codebox::core::config
