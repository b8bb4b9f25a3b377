// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/utxo/view.h"

namespace chain::utxo {

InputResolver view_resolver(const UtxoView& view) {
    return [&view](const primitives::OutPoint& op) {
        return view.get_output(op);
    };
}

InputResolver empty_resolver() {
    return [](const primitives::OutPoint&)
               -> std::optional<primitives::TxOutAux> {
        return std::nullopt;
    };
}

} // namespace chain::utxo
