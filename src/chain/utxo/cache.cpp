// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/utxo/cache.h"

#include <mutex>
#include <utility>

namespace chain::utxo {

UtxoCache::UtxoCache() = default;
UtxoCache::~UtxoCache() = default;

std::optional<primitives::TxOutAux> UtxoCache::get_output(
    const primitives::OutPoint& outpoint) const {
    std::shared_lock lock(mutex_);
    auto it = outputs_.find(outpoint);
    if (it == outputs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t UtxoCache::size() const {
    std::shared_lock lock(mutex_);
    return outputs_.size();
}

void UtxoCache::add_output(const primitives::OutPoint& outpoint,
                           primitives::TxOutAux output) {
    std::unique_lock lock(mutex_);
    outputs_.insert_or_assign(outpoint, std::move(output));
}

std::optional<primitives::TxOutAux> UtxoCache::spend_output(
    const primitives::OutPoint& outpoint) {
    std::unique_lock lock(mutex_);
    auto it = outputs_.find(outpoint);
    if (it == outputs_.end()) {
        return std::nullopt;
    }
    primitives::TxOutAux spent = std::move(it->second);
    outputs_.erase(it);
    return spent;
}

void UtxoCache::clear() {
    std::unique_lock lock(mutex_);
    outputs_.clear();
}

std::vector<primitives::OutPoint> UtxoCache::get_all_outpoints() const {
    std::shared_lock lock(mutex_);
    std::vector<primitives::OutPoint> result;
    result.reserve(outputs_.size());
    for (const auto& [op, out] : outputs_) {
        result.push_back(op);
    }
    return result;
}

} // namespace chain::utxo
