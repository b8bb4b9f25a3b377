// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "mempool/mempool.h"

#include "core/logging.h"

#include <string>
#include <utility>

namespace mempool {

bool MemPool::insert(primitives::TxAux tx) {
    core::uint256 txid = tx.txid();
    auto [it, inserted] = txs_.try_emplace(txid, std::move(tx));
    if (!inserted) {
        return false;
    }
    ++count_;
    LOG_TRACE(core::LogCategory::MEMPOOL,
              "Added " + txid.to_hex() + " (" + std::to_string(count_) +
              " pending)");
    return true;
}

bool MemPool::remove(const core::uint256& txid) {
    if (txs_.erase(txid) == 0) {
        return false;
    }
    --count_;
    LOG_TRACE(core::LogCategory::MEMPOOL,
              "Removed " + txid.to_hex() + " (" + std::to_string(count_) +
              " pending)");
    return true;
}

bool MemPool::contains(const core::uint256& txid) const {
    return txs_.count(txid) != 0;
}

std::optional<primitives::TxAux> MemPool::get(
    const core::uint256& txid) const {
    auto it = txs_.find(txid);
    if (it == txs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::uint256> MemPool::txids() const {
    std::vector<core::uint256> result;
    result.reserve(txs_.size());
    for (const auto& [txid, tx] : txs_) {
        result.push_back(txid);
    }
    return result;
}

std::vector<primitives::TxAux> MemPool::all() const {
    std::vector<primitives::TxAux> result;
    result.reserve(txs_.size());
    for (const auto& [txid, tx] : txs_) {
        result.push_back(tx);
    }
    return result;
}

void MemPool::clear() {
    txs_.clear();
    count_ = 0;
}

} // namespace mempool
