#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <utility>
#include <vector>

#include "core/error.h"
#include "core/serialize.h"
#include "primitives/address.h"
#include "primitives/coin.h"

namespace primitives {

/// A transaction output: an amount locked to an address.
struct TxOutput {
    Address address;
    Coin coin;

    TxOutput() = default;
    TxOutput(Address address_in, Coin coin_in)
        : address(std::move(address_in)), coin(coin_in) {}

    bool operator==(const TxOutput&) const = default;

    /// Wire format: pubkey (33 bytes) | coin (8 bytes LE)
    template<typename Stream>
    void serialize(Stream& s) const {
        address.serialize(s);
        coin.serialize(s);
    }

    template<typename Stream>
    static TxOutput deserialize(Stream& s) {
        TxOutput out;
        out.address = Address::deserialize(s);
        out.coin = Coin::deserialize(s);
        return out;
    }
};

/// How the stake carried by one output is split among stakeholders.
/// Empty means the whole coin goes to the owner of the output address.
using TxOutDistribution = std::vector<std::pair<StakeholderId, Coin>>;

/// Fails with VALIDATION_RANGE when @p dist is non-empty and its shares
/// do not sum exactly to @p out's coin.
core::Result<void> check_distribution(const TxOutput& out,
                                      const TxOutDistribution& dist);

/// Stake shares implied by an output: either the explicit distribution
/// or a single share for the address owner.
[[nodiscard]] TxOutDistribution stake_shares(const TxOutput& out,
                                             const TxOutDistribution& dist);

// ---------------------------------------------------------------------------
// TxOutAux -- value stored in the unspent-output set
// ---------------------------------------------------------------------------
struct TxOutAux {
    TxOutput out;
    TxOutDistribution distribution;

    TxOutAux() = default;
    TxOutAux(TxOutput out_in, TxOutDistribution dist_in = {})
        : out(std::move(out_in)), distribution(std::move(dist_in)) {}

    bool operator==(const TxOutAux&) const = default;

    [[nodiscard]] TxOutDistribution shares() const {
        return stake_shares(out, distribution);
    }

    template<typename Stream>
    void serialize(Stream& s) const {
        out.serialize(s);
        core::ser_write_compact_size(s, distribution.size());
        for (const auto& [id, coin] : distribution) {
            core::ser_write_blob(s, id);
            coin.serialize(s);
        }
    }

    template<typename Stream>
    static TxOutAux deserialize(Stream& s) {
        TxOutAux aux;
        aux.out = TxOutput::deserialize(s);
        uint64_t n = core::ser_read_compact_size(s);
        aux.distribution.reserve(static_cast<size_t>(n));
        for (uint64_t i = 0; i < n; ++i) {
            auto id = core::ser_read_blob<StakeholderId>(s);
            aux.distribution.emplace_back(id, Coin::deserialize(s));
        }
        return aux;
    }
};

} // namespace primitives
