// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/outpoint.h"

namespace primitives {

std::string OutPoint::to_string() const {
    return txid.to_hex() + ":" + std::to_string(n);
}

} // namespace primitives
