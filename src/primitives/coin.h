#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compare>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "core/error.h"
#include "core/serialize.h"

namespace primitives {

/// Non-negative monetary amount in base units, bounded by MAX_COIN.
class Coin {
    uint64_t value_ = 0;

public:
    /// Largest representable amount in base units.
    static constexpr uint64_t MAX_COIN = 45'000'000'000'000'000ULL;

    constexpr Coin() = default;

    /// Unchecked construction; use from_value() for untrusted input.
    constexpr explicit Coin(uint64_t v) : value_(v) {}

    /// Fails with VALIDATION_RANGE when v exceeds MAX_COIN.
    static core::Result<Coin> from_value(uint64_t v);

    [[nodiscard]] constexpr uint64_t value() const { return value_; }
    [[nodiscard]] constexpr bool is_zero() const { return value_ == 0; }
    [[nodiscard]] constexpr bool is_valid() const { return value_ <= MAX_COIN; }

    /// Checked addition; the sum must stay within MAX_COIN.
    [[nodiscard]] core::Result<Coin> operator+(Coin other) const;

    /// Checked subtraction; fails with VALIDATION_UNDERFLOW when
    /// @p other is larger.
    [[nodiscard]] core::Result<Coin> operator-(Coin other) const;

    constexpr bool operator==(const Coin&) const = default;
    constexpr auto operator<=>(const Coin&) const = default;

    [[nodiscard]] std::string to_string() const {
        return std::to_string(value_);
    }

    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_u64(s, value_);
    }

    /// Throws std::runtime_error for out-of-range values.
    template<typename Stream>
    static Coin deserialize(Stream& s) {
        Coin c(core::ser_read_u64(s));
        if (!c.is_valid()) {
            throw std::runtime_error("Coin::deserialize(): value above MAX_COIN");
        }
        return c;
    }
};

inline constexpr Coin ZERO_COIN{0};

} // namespace primitives
