// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"
#include "core/hex.h"

#include <algorithm>
#include <stdexcept>

namespace core {

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != N * 2) {
        throw std::invalid_argument(
            "Blob::from_hex: expected " + std::to_string(N * 2) +
            " hex chars, got " + std::to_string(hex.size()));
    }
    auto decoded = core::from_hex(hex);
    if (!decoded) {
        throw std::invalid_argument("Blob::from_hex: invalid hex character");
    }

    // Display order is reversed relative to storage.
    Blob<N> result;
    std::reverse_copy(decoded->begin(), decoded->end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    return core::to_hex_reversed(bytes_);
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

template <std::size_t N>
std::strong_ordering Blob<N>::operator<=>(const Blob& other) const noexcept {
    // Most-significant byte is the last one.
    for (std::size_t i = N; i > 0; --i) {
        if (bytes_[i - 1] != other.bytes_[i - 1]) {
            return bytes_[i - 1] < other.bytes_[i - 1]
                       ? std::strong_ordering::less
                       : std::strong_ordering::greater;
        }
    }
    return std::strong_ordering::equal;
}

template class Blob<32>;
template class Blob<20>;

std::size_t fnv1a(const uint8_t* data, std::size_t len) noexcept {
    std::size_t h = 14695981039346656037ULL;
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::size_t>(data[i]);
        h *= 1099511628211ULL;
    }
    return h;
}

}  // namespace core
