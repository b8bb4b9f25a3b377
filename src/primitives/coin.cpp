// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/coin.h"

namespace primitives {

core::Result<Coin> Coin::from_value(uint64_t v) {
    if (v > MAX_COIN) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "coin value " + std::to_string(v) + " exceeds maximum " +
                std::to_string(MAX_COIN));
    }
    return Coin(v);
}

core::Result<Coin> Coin::operator+(Coin other) const {
    // Both operands are at most MAX_COIN, so the sum cannot wrap uint64_t.
    uint64_t result = value_ + other.value_;
    if (!is_valid() || !other.is_valid() || result > MAX_COIN) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "coin addition overflow: " + to_string() + " + " +
                other.to_string());
    }
    return Coin(result);
}

core::Result<Coin> Coin::operator-(Coin other) const {
    if (other.value_ > value_) {
        return core::make_error(
            core::ErrorCode::VALIDATION_UNDERFLOW,
            "coin subtraction underflow: " + to_string() + " - " +
                other.to_string());
    }
    return Coin(value_ - other.value_);
}

} // namespace primitives
