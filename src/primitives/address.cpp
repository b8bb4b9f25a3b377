// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/address.h"
#include "crypto/keccak.h"

namespace primitives {

StakeholderId Address::stakeholder_id() const {
    return crypto::hash160(key_);
}

bool Address::is_valid() const {
    return crypto::is_valid_pubkey(key_);
}

std::string Address::to_string() const {
    return stakeholder_id().to_hex();
}

} // namespace primitives
