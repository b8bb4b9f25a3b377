// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/hex.h"

namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Value of one hex digit, or -1.
constexpr int nibble(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

void append_byte(std::string& out, uint8_t byte) {
    out.push_back(HEX_DIGITS[byte >> 4]);
    out.push_back(HEX_DIGITS[byte & 0x0f]);
}

} // anonymous namespace

std::string to_hex(std::span<const uint8_t> data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        append_byte(out, byte);
    }
    return out;
}

std::string to_hex_reversed(std::span<const uint8_t> data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (auto it = data.rbegin(); it != data.rend(); ++it) {
        append_byte(out, *it);
    }
    return out;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    if (!is_hex(hex)) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes(hex.size() / 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) |
                                        nibble(hex[2 * i + 1]));
    }
    return bytes;
}

bool is_hex(std::string_view str) {
    if (str.size() % 2 != 0) return false;
    for (char ch : str) {
        if (nibble(ch) < 0) return false;
    }
    return true;
}

}  // namespace core
