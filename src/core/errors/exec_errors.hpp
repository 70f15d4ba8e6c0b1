#pragma once
#include <string>
#include <utility>
#include <variant>

namespace codebox::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,          // E.g., malformed request JSON or an unknown CLI flag
        Configuration,  // E.g., no sandbox credential available
        Provisioning,   // E.g., the provider refused to create a sandbox
        Provider,       // E.g., a sandbox call failed in transport
        Internal        // E.g., host I/O failure or an unexpected exception
    };

    // The standardized error payload
    struct ExecError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Helpful tips for the operator
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR an ExecError.
    template <typename T>
    using Result = std::variant<T, ExecError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ExecError>(result);
    }

    template <typename T>
    const ExecError& get_error(const Result<T>& result) {
        return std::get<ExecError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Moves the value out, for move-only payloads such as sandbox leases.
    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    // Client-side problems (bad input, missing credential) versus server-side failures.
    inline bool is_client_error(const ErrorCategory category) {
        return category == ErrorCategory::Input ||
               category == ErrorCategory::Configuration;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Configuration:
                return "configuration";
            case ErrorCategory::Provisioning:
                return "provisioning";
            case ErrorCategory::Provider:
                return "provider";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace codebox::core::errors
