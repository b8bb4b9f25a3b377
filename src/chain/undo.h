#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "primitives/txout.h"

#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace chain {

// ---------------------------------------------------------------------------
// TxUndo -- outputs consumed by one transaction, in input order
// ---------------------------------------------------------------------------
// Holds exactly one entry per input. Rolling a transaction back removes
// its outputs and restores these.
// ---------------------------------------------------------------------------
struct TxUndo {
    std::vector<primitives::TxOutAux> spent;

    bool operator==(const TxUndo&) const = default;

    /// compact_size(count) | TxOutAux...
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    /// Fails with PARSE_ERROR on truncated or trailing data.
    [[nodiscard]] static core::Result<TxUndo> deserialize(
        std::span<const uint8_t> data);
};

/// Undo records of applied transactions, keyed by txid.
using UndoMap = std::unordered_map<core::uint256, TxUndo>;

} // namespace chain
