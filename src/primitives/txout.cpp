// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/txout.h"

namespace primitives {

core::Result<void> check_distribution(const TxOutput& out,
                                      const TxOutDistribution& dist) {
    if (dist.empty()) return core::make_ok();

    Coin total;
    for (const auto& [id, share] : dist) {
        auto sum = total + share;
        if (!sum) return sum.error();
        total = sum.value();
    }
    if (total != out.coin) {
        return core::make_error(
            core::ErrorCode::VALIDATION_RANGE,
            "distribution sums to " + total.to_string() +
                " but output carries " + out.coin.to_string());
    }
    return core::make_ok();
}

TxOutDistribution stake_shares(const TxOutput& out,
                               const TxOutDistribution& dist) {
    if (!dist.empty()) return dist;
    return {{out.address.stakeholder_id(), out.coin}};
}

} // namespace primitives
