#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "primitives/address.h"
#include "primitives/coin.h"
#include "primitives/txout.h"

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace txp {

// ---------------------------------------------------------------------------
// StakeView -- read-only stake lookup
// ---------------------------------------------------------------------------
class StakeView {
public:
    virtual ~StakeView() = default;

    /// Stake of @p id, or nullopt if it holds none.
    virtual std::optional<primitives::Coin> get_stake(
        const primitives::StakeholderId& id) const = 0;

    /// Sum of every stake.
    virtual primitives::Coin total_stake() const = 0;
};

// ---------------------------------------------------------------------------
// StakeStore -- in-memory confirmed stakes
// ---------------------------------------------------------------------------
class StakeStore : public StakeView {
public:
    StakeStore() = default;

    std::optional<primitives::Coin> get_stake(
        const primitives::StakeholderId& id) const override;
    primitives::Coin total_stake() const override { return total_; }

    /// Overwrite the stake of @p id; zero erases it. Keeps the total in
    /// step. Fails with VALIDATION_RANGE, changing nothing, if the stake or
    /// the new total would exceed MAX_COIN.
    core::Result<void> set_stake(const primitives::StakeholderId& id,
                                 primitives::Coin coin);

    [[nodiscard]] size_t size() const { return stakes_.size(); }

private:
    std::unordered_map<primitives::StakeholderId, primitives::Coin> stakes_;
    primitives::Coin total_;
};

// ---------------------------------------------------------------------------
// BalancesView -- pending stake changes over a StakeView
// ---------------------------------------------------------------------------
// Holds the new stake of every stakeholder touched since construction and
// the resulting total. Untouched stakeholders read through to the base.
//
// A default-constructed view has no base, no stakes and a zero total.
// ---------------------------------------------------------------------------
class BalancesView {
public:
    using StakeMap =
        std::unordered_map<primitives::StakeholderId, primitives::Coin>;

    BalancesView() = default;

    /// Empty overlay on @p base. @p base must outlive the view.
    explicit BalancesView(const StakeView& base);

    /// Current stake of @p id (zero if none).
    [[nodiscard]] primitives::Coin stake(
        const primitives::StakeholderId& id) const;

    [[nodiscard]] primitives::Coin total() const { return total_; }

    /// Fails with VALIDATION_RANGE if the stake or the total would
    /// exceed MAX_COIN.
    core::Result<void> credit(const primitives::StakeholderId& id,
                              primitives::Coin coin);

    /// Fails with VALIDATION_UNDERFLOW if @p id holds less than @p coin.
    core::Result<void> debit(const primitives::StakeholderId& id,
                             primitives::Coin coin);

    /// credit() every share. Nothing changes on failure.
    core::Result<void> credit_shares(const primitives::TxOutDistribution& shares);

    /// debit() every share. Nothing changes on failure.
    core::Result<void> debit_shares(const primitives::TxOutDistribution& shares);

    /// Stakes changed by this view.
    [[nodiscard]] const StakeMap& changed() const { return stakes_; }

    /// Write every changed stake into @p store. Fails with
    /// VALIDATION_RANGE, leaving @p store unchanged, if its total would
    /// exceed MAX_COIN.
    core::Result<void> apply_to(StakeStore& store) const;

private:
    const StakeView*  base_ = nullptr;
    StakeMap          stakes_;
    primitives::Coin  total_;
};

} // namespace txp
