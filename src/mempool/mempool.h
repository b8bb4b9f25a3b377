#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// MemPool -- pending transactions accepted as valid but not yet confirmed
// ---------------------------------------------------------------------------
// Maps txid to the transaction and its stake distributions, and keeps an
// explicit entry count that always equals the number of entries.
//
// The MemPool does NOT validate. Callers verify transactions (see
// txp::TxpModifier::process_tx) before inserting them.
//
// Thread safety: none. A MemPool is a single-writer value that is copied
// or moved together with the rest of a ledger-state modifier.
// ---------------------------------------------------------------------------

#include "core/types.h"
#include "primitives/transaction.h"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mempool {

class MemPool {
public:
    using TxMap = std::unordered_map<core::uint256, primitives::TxAux>;

    /// Empty pool.
    MemPool() = default;

    /// Add @p tx. Returns false, changing nothing, if its txid is present.
    bool insert(primitives::TxAux tx);

    /// Remove the entry for @p txid. Returns false if there was none.
    bool remove(const core::uint256& txid);

    [[nodiscard]] bool contains(const core::uint256& txid) const;

    [[nodiscard]] std::optional<primitives::TxAux> get(
        const core::uint256& txid) const;

    /// Cached count, O(1).
    [[nodiscard]] size_t size() const { return count_; }
    [[nodiscard]] bool empty() const { return count_ == 0; }

    /// Every pending txid, in unspecified order.
    [[nodiscard]] std::vector<core::uint256> txids() const;

    /// Every pending transaction, in unspecified order.
    [[nodiscard]] std::vector<primitives::TxAux> all() const;

    [[nodiscard]] const TxMap& entries() const { return txs_; }

    void clear();

private:
    TxMap  txs_;
    size_t count_ = 0;
};

} // namespace mempool
