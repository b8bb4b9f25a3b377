#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/utxo/view.h"
#include "primitives/outpoint.h"
#include "primitives/txout.h"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace chain::utxo {

// ---------------------------------------------------------------------------
// UtxoCache -- in-memory unspent-output set
// ---------------------------------------------------------------------------
// Serves as the base store that modifiers are resolved against and
// committed into.
//
// Thread safety: reads take a shared lock, writes an exclusive lock.
// ---------------------------------------------------------------------------
class UtxoCache : public UtxoView {
public:
    UtxoCache();
    ~UtxoCache() override;

    std::optional<primitives::TxOutAux> get_output(
        const primitives::OutPoint& outpoint) const override;
    size_t size() const override;

    /// Insert or overwrite the output at @p outpoint.
    void add_output(const primitives::OutPoint& outpoint,
                    primitives::TxOutAux output);

    /// Remove and return the output, or nullopt if absent.
    std::optional<primitives::TxOutAux> spend_output(
        const primitives::OutPoint& outpoint);

    void clear();

    /// Snapshot of every key currently in the set.
    std::vector<primitives::OutPoint> get_all_outpoints() const;

private:
    std::unordered_map<primitives::OutPoint, primitives::TxOutAux> outputs_;
    mutable std::shared_mutex mutex_;
};

} // namespace chain::utxo
