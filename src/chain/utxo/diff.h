#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/utxo/cache.h"
#include "chain/utxo/view.h"
#include "core/error.h"
#include "primitives/outpoint.h"
#include "primitives/txout.h"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace chain::utxo {

// ---------------------------------------------------------------------------
// UtxoModifier -- pending changes layered over a base unspent-output set
// ---------------------------------------------------------------------------
// Accumulates changes so that validation can proceed, and fail, without
// touching the base store. The modifier holds two sets:
//   - added:   outputs created and not spent again inside the modifier
//   - removed: outpoints spent through the modifier
// The two are always disjoint. Lookups consult removed, then added, then
// the base.
//
// A default-constructed modifier is empty and resolves every key exactly
// as the base does.
// ---------------------------------------------------------------------------
class UtxoModifier {
public:
    using AddedMap   = std::unordered_map<primitives::OutPoint,
                                          primitives::TxOutAux>;
    using RemovedSet = std::unordered_set<primitives::OutPoint>;

    UtxoModifier() = default;

    /// Resolve @p key through this modifier on top of @p base.
    [[nodiscard]] std::optional<primitives::TxOutAux> resolve(
        const InputResolver& base, const primitives::OutPoint& key) const;

    /// Mark @p key spent. Spending the same key twice is a no-op.
    void spend(const primitives::OutPoint& key);

    /// Create @p value at @p key. Fails with VALIDATION_DUPLICATE if @p key
    /// already resolves to an unspent output.
    core::Result<void> add(const InputResolver& base,
                           const primitives::OutPoint& key,
                           primitives::TxOutAux value);

    /// Fold @p later into this modifier so that the result equals applying
    /// this modifier and then @p later.
    void compose(const UtxoModifier& later);

    /// Resolver for (base + this modifier). Both must outlive it.
    [[nodiscard]] InputResolver resolver(const InputResolver& base) const;

    /// Write the changes into @p cache: spends first, then additions.
    void apply_to(UtxoCache& cache) const;

    [[nodiscard]] const AddedMap& added() const { return added_; }
    [[nodiscard]] const RemovedSet& removed() const { return removed_; }

    [[nodiscard]] bool empty() const {
        return added_.empty() && removed_.empty();
    }

    bool operator==(const UtxoModifier&) const = default;

private:
    AddedMap   added_;
    RemovedSet removed_;
};

} // namespace chain::utxo
