#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"
#include "core/types.h"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace core {

// ===================================================================
// Serialization concepts
// ===================================================================

template <typename T>
concept Serializable = requires(T t, DataStream& s) {
    { t.serialize(s) };
};

template <typename T>
concept Deserializable = requires(DataStream& s) {
    { T::deserialize(s) } -> std::same_as<T>;
};

/// Upper bound on any decoded length prefix (1 Mi elements / bytes).
inline constexpr size_t MAX_VECTOR_SIZE = 1u << 20;

// ===================================================================
// Little-endian fixed-width integers
// ===================================================================

template <typename Stream, std::unsigned_integral U>
inline void ser_write_le(Stream& s, U v) {
    std::array<uint8_t, sizeof(U)> buf;
    for (auto& byte : buf) {
        byte = static_cast<uint8_t>(v & 0xFF);
        if constexpr (sizeof(U) > 1) v >>= 8;
    }
    s.write(std::span<const uint8_t>(buf));
}

template <std::unsigned_integral U, typename Stream>
inline U ser_read_le(Stream& s) {
    std::array<uint8_t, sizeof(U)> buf;
    s.read(std::span<uint8_t>(buf));
    uint64_t v = 0;
    for (size_t i = sizeof(U); i > 0; --i) {
        v = (v << 8) | buf[i - 1];
    }
    return static_cast<U>(v);
}

template <typename Stream>
inline void ser_write_u8(Stream& s, uint8_t v) { ser_write_le(s, v); }
template <typename Stream>
inline void ser_write_u32(Stream& s, uint32_t v) { ser_write_le(s, v); }
template <typename Stream>
inline void ser_write_u64(Stream& s, uint64_t v) { ser_write_le(s, v); }

template <typename Stream>
inline uint8_t ser_read_u8(Stream& s) { return ser_read_le<uint8_t>(s); }
template <typename Stream>
inline uint32_t ser_read_u32(Stream& s) { return ser_read_le<uint32_t>(s); }
template <typename Stream>
inline uint64_t ser_read_u64(Stream& s) { return ser_read_le<uint64_t>(s); }

// ===================================================================
// CompactSize length prefix
// ===================================================================
// Values below 0xFD fit in the marker byte. Larger values follow a
// 0xFD, 0xFE or 0xFF marker as a 2, 4 or 8 byte little-endian integer
// and must not fit a shorter form.
// ===================================================================

template <typename Stream>
void ser_write_compact_size(Stream& s, uint64_t n) {
    if (n < 0xFD) {
        ser_write_u8(s, static_cast<uint8_t>(n));
        return;
    }
    if (n <= UINT16_MAX) {
        ser_write_u8(s, 0xFD);
        ser_write_le(s, static_cast<uint16_t>(n));
    } else if (n <= UINT32_MAX) {
        ser_write_u8(s, 0xFE);
        ser_write_u32(s, static_cast<uint32_t>(n));
    } else {
        ser_write_u8(s, 0xFF);
        ser_write_u64(s, n);
    }
}

/// Throws std::runtime_error on a non-minimal encoding or a length above
/// MAX_VECTOR_SIZE.
template <typename Stream>
uint64_t ser_read_compact_size(Stream& s) {
    const uint8_t marker = ser_read_u8(s);
    uint64_t n = marker;
    uint64_t smallest = 0;
    switch (marker) {
    case 0xFD: n = ser_read_le<uint16_t>(s); smallest = 0xFD; break;
    case 0xFE: n = ser_read_u32(s); smallest = UINT16_MAX + 1ULL; break;
    case 0xFF: n = ser_read_u64(s); smallest = UINT32_MAX + 1ULL; break;
    default: break;
    }
    if (n < smallest) {
        throw std::runtime_error("compact size: non-minimal encoding");
    }
    if (n > MAX_VECTOR_SIZE) {
        throw std::runtime_error("compact size: " + std::to_string(n) +
                                 " exceeds limit");
    }
    return n;
}

// ===================================================================
// Byte vectors, hashes and object vectors
// ===================================================================

template <typename Stream>
void ser_write_vector(Stream& s, const std::vector<uint8_t>& v) {
    ser_write_compact_size(s, v.size());
    s.write(std::span<const uint8_t>(v));
}

template <typename Stream>
std::vector<uint8_t> ser_read_vector(Stream& s) {
    uint64_t len = ser_read_compact_size(s);
    std::vector<uint8_t> result(static_cast<size_t>(len));
    s.read(std::span<uint8_t>(result));
    return result;
}

template <typename Stream, size_t N>
inline void ser_write_blob(Stream& s, const Blob<N>& blob) {
    s.write(std::span<const uint8_t>(blob.data(), N));
}

template <typename B, typename Stream>
inline B ser_read_blob(Stream& s) {
    std::array<uint8_t, B::SIZE> bytes{};
    s.read(std::span<uint8_t>(bytes));
    return B::from_bytes(std::span<const uint8_t, B::SIZE>(bytes));
}

template <typename Stream, Serializable T>
void ser_write_obj_vector(Stream& s, const std::vector<T>& v) {
    ser_write_compact_size(s, v.size());
    for (const auto& elem : v) {
        elem.serialize(s);
    }
}

template <Deserializable T, typename Stream>
std::vector<T> ser_read_obj_vector(Stream& s) {
    uint64_t count = ser_read_compact_size(s);
    std::vector<T> result;
    result.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        result.push_back(T::deserialize(s));
    }
    return result;
}

}  // namespace core
