// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/utxo/diff.h"

#include "core/logging.h"

#include <string>
#include <utility>

namespace chain::utxo {

// ---------------------------------------------------------------------------
// resolve
// ---------------------------------------------------------------------------

std::optional<primitives::TxOutAux> UtxoModifier::resolve(
    const InputResolver& base, const primitives::OutPoint& key) const {
    if (removed_.count(key)) {
        return std::nullopt;
    }
    auto it = added_.find(key);
    if (it != added_.end()) {
        return it->second;
    }
    return base(key);
}

// ---------------------------------------------------------------------------
// spend / add
// ---------------------------------------------------------------------------

void UtxoModifier::spend(const primitives::OutPoint& key) {
    added_.erase(key);
    removed_.insert(key);
}

core::Result<void> UtxoModifier::add(const InputResolver& base,
                                     const primitives::OutPoint& key,
                                     primitives::TxOutAux value) {
    if (resolve(base, key).has_value()) {
        return core::Error(core::ErrorCode::VALIDATION_DUPLICATE,
            "Output already unspent: " + key.to_string());
    }
    removed_.erase(key);
    added_.insert_or_assign(key, std::move(value));
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// compose
// ---------------------------------------------------------------------------

void UtxoModifier::compose(const UtxoModifier& later) {
    for (const auto& key : later.removed_) {
        spend(key);
    }
    for (const auto& [key, value] : later.added_) {
        removed_.erase(key);
        added_.insert_or_assign(key, value);
    }
}

// ---------------------------------------------------------------------------
// resolver / apply_to
// ---------------------------------------------------------------------------

InputResolver UtxoModifier::resolver(const InputResolver& base) const {
    return [this, base](const primitives::OutPoint& key) {
        return resolve(base, key);
    };
}

void UtxoModifier::apply_to(UtxoCache& cache) const {
    for (const auto& key : removed_) {
        cache.spend_output(key);
    }
    for (const auto& [key, value] : added_) {
        cache.add_output(key, value);
    }

    LOG_DEBUG(core::LogCategory::UTXO,
              "Applied UTXO modifier: " + std::to_string(removed_.size()) +
              " spent, " + std::to_string(added_.size()) + " added");
}

} // namespace chain::utxo
