#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Dependency ordering of transaction batches
// ---------------------------------------------------------------------------
// A transaction depends on every batch member whose txid one of its inputs
// references. The sorted batch lists each producer before its consumers.
// Whenever several members are ready, the lowest input index goes first.
// Unrelated members may therefore change their relative order.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "primitives/transaction.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace consensus {

/// Topological order of nodes 0..parents.size()-1 where parents[i] lists
/// the nodes that must precede i. Returns nullopt if the graph has a cycle.
[[nodiscard]] std::optional<std::vector<size_t>> topsort_graph(
    const std::vector<std::vector<size_t>>& parents);

/// Indices of @p txs in dependency order. Fails with VALIDATION_CYCLE.
[[nodiscard]] core::Result<std::vector<size_t>> topsort_order(
    const std::vector<primitives::Transaction>& txs);

/// The same multiset of transactions, in dependency order.
[[nodiscard]] core::Result<std::vector<primitives::Transaction>> topsort_txs(
    const std::vector<primitives::Transaction>& txs);

[[nodiscard]] core::Result<std::vector<primitives::TxAux>> topsort_txs(
    const std::vector<primitives::TxAux>& txs);

} // namespace consensus
