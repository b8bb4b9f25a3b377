// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "txp/modifier.h"

#include "consensus/topsort.h"
#include "consensus/tx_verify.h"
#include "core/logging.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

namespace txp {

namespace {

/// Verify @p tx over (base + utxo) and fold its effects into @p utxo and
/// @p balances. On failure neither is modified.
core::Result<chain::TxUndo> apply_tx(
    const chain::utxo::InputResolver& base,
    chain::utxo::UtxoModifier& utxo,
    BalancesView& balances,
    const primitives::TxAux& aux,
    int sig_check_threads) {
    const auto& tx = aux.tx;

    TXP_TRY_VOID(aux.check_distributions());

    auto verified = consensus::verify_tx(utxo.resolver(base), tx,
                                         sig_check_threads);
    if (!verified) {
        return core::Error(core::ErrorCode::VALIDATION_REJECTED,
            "Transaction " + aux.txid().to_hex() + " rejected: " +
            verified.error().format());
    }
    chain::TxUndo undo = std::move(verified).value();

    for (uint32_t i = 0; i < tx.vout().size(); ++i) {
        auto op = tx.outpoint(i);
        if (utxo.resolve(base, op)) {
            return core::Error(core::ErrorCode::VALIDATION_DUPLICATE,
                               "Output already unspent: " + op.to_string());
        }
    }

    // Stakes move from the spent outputs to the new ones. Debiting first
    // keeps every intermediate balance and total within MAX_COIN.
    BalancesView next = balances;
    for (const auto& spent : undo.spent) {
        TXP_TRY_VOID(next.debit_shares(spent.shares()));
    }
    for (size_t i = 0; i < tx.vout().size(); ++i) {
        TXP_TRY_VOID(next.credit_shares(aux.output_aux(i).shares()));
    }

    // The outputs were checked above, so no add() below can fail.
    for (const auto& in : tx.vin()) {
        utxo.spend(in.prevout);
    }
    for (uint32_t i = 0; i < tx.vout().size(); ++i) {
        TXP_TRY_VOID(utxo.add(base, tx.outpoint(i), aux.output_aux(i)));
    }

    balances = std::move(next);
    return undo;
}

/// Reverse @p aux using @p undo. On failure nothing is modified.
core::Result<void> rollback_tx(
    const chain::utxo::InputResolver& base,
    chain::utxo::UtxoModifier& utxo,
    BalancesView& balances,
    const primitives::TxAux& aux,
    const chain::TxUndo& undo) {
    const auto& tx = aux.tx;

    if (undo.spent.size() != tx.vin().size()) {
        return core::Error(core::ErrorCode::STORAGE_CORRUPT,
            "Undo record of " + aux.txid().to_hex() + " has " +
            std::to_string(undo.spent.size()) + " entries for " +
            std::to_string(tx.vin().size()) + " inputs");
    }

    chain::utxo::UtxoModifier next_utxo = utxo;
    for (uint32_t i = 0; i < tx.vout().size(); ++i) {
        auto op = tx.outpoint(i);
        if (!next_utxo.resolve(base, op)) {
            return core::Error(core::ErrorCode::VALIDATION_INPUT,
                "Cannot roll back " + aux.txid().to_hex() + ": output " +
                op.to_string() + " is not unspent");
        }
        next_utxo.spend(op);
    }
    for (size_t i = 0; i < tx.vin().size(); ++i) {
        TXP_TRY_VOID(next_utxo.add(base, tx.vin()[i].prevout, undo.spent[i]));
    }

    BalancesView next = balances;
    for (size_t i = 0; i < tx.vout().size(); ++i) {
        TXP_TRY_VOID(next.debit_shares(aux.output_aux(i).shares()));
    }
    for (const auto& spent : undo.spent) {
        TXP_TRY_VOID(next.credit_shares(spent.shares()));
    }

    utxo = std::move(next_utxo);
    balances = std::move(next);
    return core::make_ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// TxpModifier::process_tx
// ---------------------------------------------------------------------------

core::Result<void> TxpModifier::process_tx(const chain::utxo::UtxoView& base,
                                           const primitives::TxAux& tx,
                                           const TxpSettings& settings) {
    const auto& txid = tx.txid();

    if (mempool.contains(txid)) {
        return core::Error(core::ErrorCode::VALIDATION_KNOWN,
                           "Transaction already pending: " + txid.to_hex());
    }
    if (mempool.size() >= settings.max_mempool_txs) {
        LOG_DEBUG(core::LogCategory::MEMPOOL,
                  "Pool full (" + std::to_string(mempool.size()) +
                  "), rejecting " + txid.to_hex());
        return core::Error(core::ErrorCode::VALIDATION_POOL_FULL,
            "Mempool holds " + std::to_string(mempool.size()) +
            " transactions");
    }

    auto undo = apply_tx(chain::utxo::view_resolver(base), utxo, balances,
                         tx, settings.sig_check_threads);
    if (!undo) {
        LOG_DEBUG(core::LogCategory::MEMPOOL,
                  "process_tx: " + undo.error().message());
        return undo.error();
    }

    undos.insert_or_assign(txid, std::move(undo).value());
    mempool.insert(tx);

    LOG_DEBUG(core::LogCategory::MEMPOOL,
              "Accepted " + txid.to_hex() + " (" +
              std::to_string(mempool.size()) + " pending)");
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// build_block_modifier
// ---------------------------------------------------------------------------

core::Result<TxpModifier> build_block_modifier(
    const chain::utxo::UtxoView& base,
    const StakeView& stakes,
    const std::vector<primitives::TxAux>& batch,
    const TxpSettings& settings) {
    auto sorted = TXP_TRY(consensus::topsort_txs(batch));

    TxpModifier mod(stakes);
    auto base_resolver = chain::utxo::view_resolver(base);

    for (size_t i = 0; i < sorted.size(); ++i) {
        const auto& aux = sorted[i];
        auto undo = apply_tx(base_resolver, mod.utxo, mod.balances, aux,
                             settings.sig_check_threads);
        if (!undo) {
            LOG_WARN(core::LogCategory::VALIDATION,
                     "Batch of " + std::to_string(batch.size()) +
                     " aborted at position " + std::to_string(i) + ": " +
                     undo.error().message());
            return core::Error(core::ErrorCode::VALIDATION_REJECTED,
                "Batch member " + aux.txid().to_hex() + " failed: " +
                undo.error().message());
        }
        mod.undos.insert_or_assign(aux.txid(), std::move(undo).value());
    }

    LOG_DEBUG(core::LogCategory::VALIDATION,
              "Built modifier for " + std::to_string(sorted.size()) +
              " transactions");
    return mod;
}

// ---------------------------------------------------------------------------
// build_rollback_modifier
// ---------------------------------------------------------------------------

core::Result<TxpModifier> build_rollback_modifier(
    const chain::utxo::UtxoView& base,
    const StakeView& stakes,
    const std::vector<primitives::TxAux>& txs,
    const chain::UndoMap& undos) {
    auto sorted = TXP_TRY(consensus::topsort_txs(txs));
    std::reverse(sorted.begin(), sorted.end());

    TxpModifier mod(stakes);
    auto base_resolver = chain::utxo::view_resolver(base);

    for (const auto& aux : sorted) {
        auto it = undos.find(aux.txid());
        if (it == undos.end()) {
            return core::Error(core::ErrorCode::STORAGE_NOT_FOUND,
                               "No undo record for " + aux.txid().to_hex());
        }
        auto res = rollback_tx(base_resolver, mod.utxo, mod.balances, aux,
                               it->second);
        if (!res) {
            LOG_WARN(core::LogCategory::VALIDATION,
                     "Rollback aborted: " + res.error().message());
            return res.error();
        }
    }

    LOG_DEBUG(core::LogCategory::VALIDATION,
              "Built rollback for " + std::to_string(sorted.size()) +
              " transactions");
    return mod;
}

// ---------------------------------------------------------------------------
// normalize_mempool
// ---------------------------------------------------------------------------

TxpModifier normalize_mempool(const chain::utxo::UtxoView& base,
                              const StakeView& stakes,
                              const mempool::MemPool& pending,
                              const TxpSettings& settings) {
    std::vector<primitives::TxAux> txs = pending.all();

    // Pool contents never form a cycle, but fall back to pool order anyway.
    auto sorted = consensus::topsort_txs(txs);
    if (sorted) {
        txs = std::move(sorted).value();
    }

    TxpModifier mod(stakes);
    size_t dropped = 0;
    for (const auto& aux : txs) {
        auto res = mod.process_tx(base, aux, settings);
        if (!res) {
            ++dropped;
            LOG_DEBUG(core::LogCategory::MEMPOOL,
                      "Dropping " + aux.txid().to_hex() + ": " +
                      res.error().message());
        }
    }

    LOG_INFO(core::LogCategory::MEMPOOL,
             "Normalized mempool: kept " + std::to_string(mod.mempool.size()) +
             ", dropped " + std::to_string(dropped));
    return mod;
}

// ---------------------------------------------------------------------------
// commit_modifier
// ---------------------------------------------------------------------------

core::Result<void> commit_modifier(const TxpModifier& mod,
                                   chain::utxo::UtxoCache& utxo,
                                   StakeStore& stakes) {
    TXP_TRY_VOID(mod.balances.apply_to(stakes));
    mod.utxo.apply_to(utxo);

    LOG_INFO(core::LogCategory::UTXO,
             "Committed modifier: " +
             std::to_string(mod.utxo.removed().size()) + " spent, " +
             std::to_string(mod.utxo.added().size()) + " created, " +
             std::to_string(mod.balances.changed().size()) +
             " stakes changed, total stake " +
             mod.balances.total().to_string());
    return core::make_ok();
}

} // namespace txp
