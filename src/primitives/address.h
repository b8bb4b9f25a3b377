#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/serialize.h"
#include "core/types.h"
#include "crypto/secp256k1.h"

#include <cstdint>
#include <functional>
#include <span>
#include <string>

namespace primitives {

/// Identifier of a stake holder: Hash160 of its compressed public key.
using StakeholderId = core::uint160;

// ---------------------------------------------------------------------------
// Address -- pay-to-public-key destination
// ---------------------------------------------------------------------------
// An output is spendable by whoever can sign with the key held here.
// ---------------------------------------------------------------------------
class Address {
public:
    Address() = default;
    explicit Address(const crypto::PubKey& key) : key_(key) {}

    static Address from_key(const crypto::ECKey& key) {
        return Address(key.pubkey_compressed());
    }

    [[nodiscard]] const crypto::PubKey& pubkey() const { return key_; }

    /// Hash160 of the public key.
    [[nodiscard]] StakeholderId stakeholder_id() const;

    /// True when the key decodes to a point on the curve.
    [[nodiscard]] bool is_valid() const;

    /// Check @p der_sig over @p hash under this address's key.
    [[nodiscard]] bool verify(const core::uint256& hash,
                              std::span<const uint8_t> der_sig) const {
        return crypto::ECKey::verify(key_, hash, der_sig);
    }

    /// Hex of the stakeholder id, for logs.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Address&) const = default;

    template<typename Stream>
    void serialize(Stream& s) const {
        s.write(std::span<const uint8_t>(key_));
    }

    template<typename Stream>
    static Address deserialize(Stream& s) {
        Address a;
        s.read(std::span<uint8_t>(a.key_));
        return a;
    }

private:
    crypto::PubKey key_{};
};

} // namespace primitives
