#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codebox::core::encoding {

// Standard alphabet (RFC 4648), padded with '='.
std::string base64_encode(const std::vector<std::uint8_t>& bytes);
std::string base64_encode(const std::string& bytes);

// Returns std::nullopt on a character outside the alphabet or bad padding.
std::optional<std::vector<std::uint8_t>> base64_decode(const std::string& text);

}  // namespace codebox::core::encoding
