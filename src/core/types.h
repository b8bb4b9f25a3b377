#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size byte array used for hashes and key identifiers
// ---------------------------------------------------------------------------
// Bytes are kept in the order the hash function produced them. Hex display
// is big-endian (last byte first), so the identifiers printed in logs read
// the same way the rest of the ecosystem prints them.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    constexpr Blob() noexcept : bytes_{} {}

    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse a big-endian display hex string of exactly 2*N characters,
    /// optionally prefixed by "0x". Throws std::invalid_argument.
    static Blob from_hex(std::string_view hex);

    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t, N> span() const noexcept {
        return std::span<const uint8_t, N>(bytes_);
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }
    [[nodiscard]] bool is_zero() const noexcept;

    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept;
    [[nodiscard]] bool operator==(const Blob& other) const noexcept {
        return bytes_ == other.bytes_;
    }

protected:
    std::array<uint8_t, N> bytes_;
};

// 256-bit identifier: transaction ids and signature hashes.
class uint256 : public Blob<32> {
public:
    using Blob<32>::Blob;
    constexpr uint256() noexcept = default;
    uint256(const Blob<32>& b) noexcept : Blob<32>(b) {}  // NOLINT implicit

    static uint256 from_hex(std::string_view hex) {
        return Blob<32>::from_hex(hex);
    }
    static uint256 from_bytes(std::span<const uint8_t, 32> bytes) noexcept {
        return Blob<32>::from_bytes(bytes);
    }
};

// 160-bit identifier: stakeholder ids (Hash160 of a public key).
class uint160 : public Blob<20> {
public:
    using Blob<20>::Blob;
    constexpr uint160() noexcept = default;
    uint160(const Blob<20>& b) noexcept : Blob<20>(b) {}  // NOLINT implicit

    static uint160 from_hex(std::string_view hex) {
        return Blob<20>::from_hex(hex);
    }
    static uint160 from_bytes(std::span<const uint8_t, 20> bytes) noexcept {
        return Blob<20>::from_bytes(bytes);
    }
};

/// FNV-1a over a byte range, used for hash-table bucketing only.
[[nodiscard]] std::size_t fnv1a(const uint8_t* data, std::size_t len) noexcept;

}  // namespace core

template <>
struct std::hash<core::uint256> {
    std::size_t operator()(const core::uint256& v) const noexcept {
        return core::fnv1a(v.data(), v.size());
    }
};

template <>
struct std::hash<core::uint160> {
    std::size_t operator()(const core::uint160& v) const noexcept {
        return core::fnv1a(v.data(), v.size());
    }
};
