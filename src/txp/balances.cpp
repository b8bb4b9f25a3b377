// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "txp/balances.h"

#include "core/logging.h"

#include <string>
#include <utility>

namespace txp {

// ---------------------------------------------------------------------------
// StakeStore
// ---------------------------------------------------------------------------

std::optional<primitives::Coin> StakeStore::get_stake(
    const primitives::StakeholderId& id) const {
    auto it = stakes_.find(id);
    if (it == stakes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

core::Result<void> StakeStore::set_stake(const primitives::StakeholderId& id,
                                         primitives::Coin coin) {
    if (!coin.is_valid()) {
        return core::Error(core::ErrorCode::VALIDATION_RANGE,
                           "Stake " + coin.to_string() + " above MAX_COIN");
    }
    auto old_stake = get_stake(id).value_or(primitives::ZERO_COIN);
    auto without = TXP_TRY(total_ - old_stake);
    auto new_total = TXP_TRY(without + coin);

    if (coin.is_zero()) {
        stakes_.erase(id);
    } else {
        stakes_.insert_or_assign(id, coin);
    }
    total_ = new_total;
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// BalancesView
// ---------------------------------------------------------------------------

BalancesView::BalancesView(const StakeView& base)
    : base_(&base), total_(base.total_stake()) {}

primitives::Coin BalancesView::stake(
    const primitives::StakeholderId& id) const {
    auto it = stakes_.find(id);
    if (it != stakes_.end()) {
        return it->second;
    }
    if (base_) {
        return base_->get_stake(id).value_or(primitives::ZERO_COIN);
    }
    return primitives::ZERO_COIN;
}

core::Result<void> BalancesView::credit(const primitives::StakeholderId& id,
                                        primitives::Coin coin) {
    auto new_stake = TXP_TRY(stake(id) + coin);
    auto new_total = TXP_TRY(total_ + coin);
    stakes_.insert_or_assign(id, new_stake);
    total_ = new_total;
    return core::make_ok();
}

core::Result<void> BalancesView::debit(const primitives::StakeholderId& id,
                                       primitives::Coin coin) {
    auto current = stake(id);
    auto new_stake = current - coin;
    if (!new_stake) {
        return core::Error(core::ErrorCode::VALIDATION_UNDERFLOW,
            "Stake of " + id.to_hex() + " is " + current.to_string() +
            ", cannot debit " + coin.to_string());
    }
    auto new_total = TXP_TRY(total_ - coin);
    stakes_.insert_or_assign(id, new_stake.value());
    total_ = new_total;
    return core::make_ok();
}

core::Result<void> BalancesView::credit_shares(
    const primitives::TxOutDistribution& shares) {
    BalancesView next = *this;
    for (const auto& [id, coin] : shares) {
        TXP_TRY_VOID(next.credit(id, coin));
    }
    *this = std::move(next);
    return core::make_ok();
}

core::Result<void> BalancesView::debit_shares(
    const primitives::TxOutDistribution& shares) {
    BalancesView next = *this;
    for (const auto& [id, coin] : shares) {
        TXP_TRY_VOID(next.debit(id, coin));
    }
    *this = std::move(next);
    return core::make_ok();
}

core::Result<void> BalancesView::apply_to(StakeStore& store) const {
    // Check the resulting total first so a failure leaves the store as is.
    auto total = store.total_stake();
    for (const auto& entry : stakes_) {
        total = TXP_TRY(total - store.get_stake(entry.first)
                                    .value_or(primitives::ZERO_COIN));
    }
    for (const auto& entry : stakes_) {
        total = TXP_TRY(total + entry.second);
    }

    // Lowered stakes go in first, so the running total never exceeds the
    // final one.
    for (int pass = 0; pass < 2; ++pass) {
        for (const auto& [id, coin] : stakes_) {
            auto old_stake =
                store.get_stake(id).value_or(primitives::ZERO_COIN);
            if ((coin < old_stake) == (pass == 0)) {
                TXP_TRY_VOID(store.set_stake(id, coin));
            }
        }
    }

    if (total != total_) {
        LOG_WARN(core::LogCategory::STAKES,
                 "Stake total after commit is " + total.to_string() +
                 ", expected " + total_.to_string());
    }
    return core::make_ok();
}

} // namespace txp
