// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/topsort.h"

#include "core/logging.h"
#include "core/types.h"

#include <algorithm>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>

namespace consensus {

// ---------------------------------------------------------------------------
// topsort_graph  --  Kahn's algorithm, lowest ready index first
// ---------------------------------------------------------------------------

std::optional<std::vector<size_t>> topsort_graph(
    const std::vector<std::vector<size_t>>& parents) {
    const size_t n = parents.size();
    std::vector<std::vector<size_t>> children(n);
    std::vector<size_t> pending(n, 0);

    for (size_t i = 0; i < n; ++i) {
        std::vector<size_t> unique_parents = parents[i];
        std::sort(unique_parents.begin(), unique_parents.end());
        unique_parents.erase(
            std::unique(unique_parents.begin(), unique_parents.end()),
            unique_parents.end());
        for (size_t p : unique_parents) {
            if (p >= n) continue;
            children[p].push_back(i);
            ++pending[i];
        }
    }

    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (size_t i = 0; i < n; ++i) {
        if (pending[i] == 0) ready.push(i);
    }

    std::vector<size_t> order;
    order.reserve(n);
    while (!ready.empty()) {
        size_t node = ready.top();
        ready.pop();
        order.push_back(node);
        for (size_t child : children[node]) {
            if (--pending[child] == 0) ready.push(child);
        }
    }

    // Nodes left with pending parents sit on or behind a cycle.
    if (order.size() != n) {
        return std::nullopt;
    }
    return order;
}

// ---------------------------------------------------------------------------
// topsort_order
// ---------------------------------------------------------------------------

core::Result<std::vector<size_t>> topsort_order(
    const std::vector<primitives::Transaction>& txs) {
    std::unordered_map<core::uint256, std::vector<size_t>> producers;
    for (size_t i = 0; i < txs.size(); ++i) {
        producers[txs[i].txid()].push_back(i);
    }

    std::vector<std::vector<size_t>> parents(txs.size());
    for (size_t i = 0; i < txs.size(); ++i) {
        for (const auto& in : txs[i].vin()) {
            auto it = producers.find(in.prevout.txid);
            if (it == producers.end()) continue;
            parents[i].insert(parents[i].end(),
                              it->second.begin(), it->second.end());
        }
    }

    auto order = topsort_graph(parents);
    if (!order) {
        LOG_WARN(core::LogCategory::VALIDATION,
                 "topsort: dependency cycle among " +
                 std::to_string(txs.size()) + " transactions");
        return core::Error(core::ErrorCode::VALIDATION_CYCLE,
                           "Transaction batch contains a dependency cycle");
    }
    return std::move(*order);
}

// ---------------------------------------------------------------------------
// topsort_txs
// ---------------------------------------------------------------------------

core::Result<std::vector<primitives::Transaction>> topsort_txs(
    const std::vector<primitives::Transaction>& txs) {
    auto order = TXP_TRY(topsort_order(txs));
    std::vector<primitives::Transaction> sorted;
    sorted.reserve(order.size());
    for (size_t i : order) {
        sorted.push_back(txs[i]);
    }
    return sorted;
}

core::Result<std::vector<primitives::TxAux>> topsort_txs(
    const std::vector<primitives::TxAux>& txs) {
    std::vector<primitives::Transaction> plain;
    plain.reserve(txs.size());
    for (const auto& aux : txs) {
        plain.push_back(aux.tx);
    }

    auto order = TXP_TRY(topsort_order(plain));
    std::vector<primitives::TxAux> sorted;
    sorted.reserve(order.size());
    for (size_t i : order) {
        sorted.push_back(txs[i]);
    }
    return sorted;
}

} // namespace consensus
