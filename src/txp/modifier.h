#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// TxpModifier -- one atomically applied change to the ledger state
// ---------------------------------------------------------------------------
// Bundles the unspent-output changes, the stake changes, the pending pool
// and the undo record of every transaction folded in. A modifier never
// touches the base stores it was built against; commit_modifier() writes
// it into them, and dropping it discards every change.
//
// Builders:
//   process_tx()              -- accept one pending transaction
//   build_block_modifier()    -- apply a confirmed batch
//   build_rollback_modifier() -- undo a previously applied batch
//   normalize_mempool()       -- re-accept pending txs over a new base
// ---------------------------------------------------------------------------

#include "chain/undo.h"
#include "chain/utxo/cache.h"
#include "chain/utxo/diff.h"
#include "chain/utxo/view.h"
#include "core/error.h"
#include "mempool/mempool.h"
#include "primitives/transaction.h"
#include "txp/balances.h"
#include "txp/settings.h"

#include <vector>

namespace txp {

struct TxpModifier {
    chain::utxo::UtxoModifier utxo;
    BalancesView              balances;
    mempool::MemPool          mempool;
    chain::UndoMap            undos;

    /// Empty modifier with zero balances.
    TxpModifier() = default;

    /// Empty modifier whose balances read through to @p stakes.
    explicit TxpModifier(const StakeView& stakes) : balances(stakes) {}

    /// Verify @p tx against (base + this modifier) and fold it in,
    /// including its mempool entry and undo record.
    ///
    /// Fails, leaving the modifier unchanged, with:
    ///   VALIDATION_KNOWN      -- tx is already pending
    ///   VALIDATION_POOL_FULL  -- settings.max_mempool_txs reached
    ///   VALIDATION_RANGE      -- a distribution does not match its output
    ///   VALIDATION_REJECTED   -- verify_tx() found violations
    ///   VALIDATION_DUPLICATE  -- an output of tx already exists
    ///   VALIDATION_UNDERFLOW  -- a stake would go negative
    core::Result<void> process_tx(const chain::utxo::UtxoView& base,
                                  const primitives::TxAux& tx,
                                  const TxpSettings& settings);
};

/// Topologically sort @p batch and fold every member into a fresh modifier
/// over @p base and @p stakes. The mempool part stays empty. Any failure
/// abandons the whole batch (VALIDATION_CYCLE or VALIDATION_REJECTED).
[[nodiscard]] core::Result<TxpModifier> build_block_modifier(
    const chain::utxo::UtxoView& base,
    const StakeView& stakes,
    const std::vector<primitives::TxAux>& batch,
    const TxpSettings& settings);

/// Modifier that reverses @p txs, previously applied to produce @p base:
/// their outputs are spent again, the outputs recorded in @p undos are
/// restored and stake changes are reversed. Consumers are undone before
/// their producers.
[[nodiscard]] core::Result<TxpModifier> build_rollback_modifier(
    const chain::utxo::UtxoView& base,
    const StakeView& stakes,
    const std::vector<primitives::TxAux>& txs,
    const chain::UndoMap& undos);

/// Re-process every transaction of @p pending over @p base, in dependency
/// order. Transactions that no longer verify are dropped.
[[nodiscard]] TxpModifier normalize_mempool(
    const chain::utxo::UtxoView& base,
    const StakeView& stakes,
    const mempool::MemPool& pending,
    const TxpSettings& settings);

/// Write the stake and unspent-output changes of @p mod into the stores.
/// Fails with VALIDATION_RANGE, before touching @p utxo, if @p stakes is
/// not the store the modifier was built against and a stake would leave
/// the coin range.
core::Result<void> commit_modifier(const TxpModifier& mod,
                                   chain::utxo::UtxoCache& utxo,
                                   StakeStore& stakes);

} // namespace txp
