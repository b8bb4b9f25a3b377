#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Helpers shared by the ledger tests: deterministic keys, funding outputs
// and signed transactions.

#include "core/types.h"
#include "crypto/keccak.h"
#include "crypto/secp256k1.h"
#include "primitives/address.h"
#include "primitives/coin.h"
#include "primitives/outpoint.h"
#include "primitives/transaction.h"
#include "primitives/txout.h"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test {

/// Key derived from @p seed. The same seed always yields the same key.
inline crypto::ECKey make_key(uint32_t seed) {
    std::array<uint8_t, 4> seed_bytes = {
        static_cast<uint8_t>(seed >> 24), static_cast<uint8_t>(seed >> 16),
        static_cast<uint8_t>(seed >> 8), static_cast<uint8_t>(seed)};
    core::uint256 secret = crypto::keccak256(seed_bytes);
    auto key = crypto::ECKey::from_secret(secret.span());
    if (!key) {
        throw std::runtime_error("make_key: " + key.error().format());
    }
    return std::move(key).value();
}

inline primitives::Address address_of(const crypto::ECKey& key) {
    return primitives::Address::from_key(key);
}

/// Outpoint of an imaginary transaction, for seeding base stores.
inline primitives::OutPoint fake_outpoint(uint32_t id, uint32_t n = 0) {
    std::array<uint8_t, 8> bytes = {
        0xf0, 0x0d,
        static_cast<uint8_t>(id >> 24), static_cast<uint8_t>(id >> 16),
        static_cast<uint8_t>(id >> 8), static_cast<uint8_t>(id),
        0, 0};
    return primitives::OutPoint(crypto::keccak256(bytes), n);
}

/// Output of @p value coins to the owner of @p key.
inline primitives::TxOutput output_to(const crypto::ECKey& key,
                                      uint64_t value) {
    return primitives::TxOutput(address_of(key), primitives::Coin(value));
}

/// An input to sign: the outpoint spent and the key owning it.
struct Spend {
    primitives::OutPoint prevout;
    const crypto::ECKey* key;
};

/// Transaction spending @p spends into @p outputs, every input signed.
inline primitives::Transaction make_tx(
    const std::vector<Spend>& spends,
    const std::vector<primitives::TxOutput>& outputs) {
    std::vector<primitives::TxInput> vin;
    vin.reserve(spends.size());
    for (const auto& spend : spends) {
        auto sig = primitives::sign_input(*spend.key, spend.prevout, outputs);
        if (!sig) {
            throw std::runtime_error("make_tx: " + sig.error().format());
        }
        vin.emplace_back(spend.prevout, std::move(sig).value());
    }
    return primitives::Transaction(std::move(vin), outputs);
}

} // namespace test
