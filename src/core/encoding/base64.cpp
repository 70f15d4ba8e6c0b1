#include "core/encoding/base64.hpp"

namespace codebox::core::encoding {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

int position_of(const unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

template <typename Bytes>
std::string encode_bytes(const Bytes& input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::uint32_t value = 0;
    int bits = -6;
    for (const auto byte : input) {
        value = (value << 8) + static_cast<unsigned char>(byte);
        bits += 8;
        while (bits >= 0) {
            output.push_back(kAlphabet[(value >> bits) & 0x3F]);
            bits -= 6;
        }
    }
    if (bits > -6) {
        output.push_back(kAlphabet[((value << 8) >> (bits + 8)) & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

}  // namespace

std::string base64_encode(const std::vector<std::uint8_t>& bytes) {
    return encode_bytes(bytes);
}

std::string base64_encode(const std::string& bytes) {
    return encode_bytes(bytes);
}

std::optional<std::vector<std::uint8_t>> base64_decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> output;
    output.reserve((text.size() / 4) * 3);

    std::uint32_t value = 0;
    int bits = -8;
    std::size_t padding = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '=') {
            // Padding only in the last two positions.
            if (i + 2 < text.size()) {
                return std::nullopt;
            }
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::nullopt;
        }
        const int pos = position_of(c);
        if (pos < 0) {
            return std::nullopt;
        }
        value = (value << 6) + static_cast<std::uint32_t>(pos);
        bits += 6;
        if (bits >= 0) {
            output.push_back(static_cast<std::uint8_t>((value >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return output;
}

}  // namespace codebox::core::encoding
