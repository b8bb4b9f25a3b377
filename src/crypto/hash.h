#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"
#include "crypto/keccak.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace crypto {

/// Write-only stream for the core::ser_* functions. hash() is keccak256d
/// of everything written, so serialising an object into a HashWriter gives
/// the same id as hashing its encoding.
class HashWriter {
public:
    void write(std::span<const uint8_t> data) { inner_.write(data); }

    [[nodiscard]] core::uint256 hash() const {
        return keccak256(inner_.digest().span());
    }

    [[nodiscard]] size_t size() const noexcept { return inner_.size(); }

private:
    Keccak256Hasher inner_;
};

}  // namespace crypto
