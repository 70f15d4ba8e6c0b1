#include "session/credential_resolver.hpp"

#include <cctype>

namespace codebox::session {

namespace {

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }
    return value.substr(begin, end - begin);
}

}  // namespace

std::optional<std::string> resolve_credential(
    const std::optional<std::string>& per_request_value,
    const std::string& process_default) {
    if (per_request_value.has_value()) {
        std::string key = trim(*per_request_value);
        if (!key.empty()) {
            return key;
        }
    }
    std::string fallback = trim(process_default);
    if (!fallback.empty()) {
        return fallback;
    }
    return std::nullopt;
}

}  // namespace codebox::session
