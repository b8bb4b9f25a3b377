#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/outpoint.h"
#include "primitives/txout.h"

#include <cstddef>
#include <functional>
#include <optional>

namespace chain::utxo {

// ---------------------------------------------------------------------------
// UtxoView -- abstract read-only interface to an unspent-output set
// ---------------------------------------------------------------------------
// Implemented by the in-memory UtxoCache here; a persistent store plugs in
// the same way.
// ---------------------------------------------------------------------------
class UtxoView {
public:
    virtual ~UtxoView() = default;

    /// The unspent output at @p outpoint, or nullopt if it does not exist
    /// or has been spent.
    virtual std::optional<primitives::TxOutAux> get_output(
        const primitives::OutPoint& outpoint) const = 0;

    /// Number of unspent outputs.
    virtual size_t size() const = 0;

    bool has_output(const primitives::OutPoint& outpoint) const {
        return get_output(outpoint).has_value();
    }
};

/// Lookup function used by verification: outpoint -> unspent output.
using InputResolver = std::function<std::optional<primitives::TxOutAux>(
    const primitives::OutPoint&)>;

/// Resolver reading straight from @p view. The view must outlive it.
InputResolver view_resolver(const UtxoView& view);

/// Resolver that never finds anything.
InputResolver empty_resolver();

} // namespace chain::utxo
