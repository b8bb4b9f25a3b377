#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

struct evp_md_ctx_st;

namespace crypto {

// The "keccak256" family below is the FIPS-202 SHA3-256 digest.

[[nodiscard]] core::uint256 keccak256(std::span<const uint8_t> data);

/// keccak256(keccak256(data)).
[[nodiscard]] core::uint256 keccak256d(std::span<const uint8_t> data);

/// First 20 bytes of keccak256d(data).
[[nodiscard]] core::uint160 hash160(std::span<const uint8_t> data);

/// Incremental keccak256. Throws std::runtime_error if OpenSSL fails.
class Keccak256Hasher {
public:
    Keccak256Hasher();
    ~Keccak256Hasher();

    Keccak256Hasher(Keccak256Hasher&&) noexcept;
    Keccak256Hasher& operator=(Keccak256Hasher&&) noexcept;

    void write(std::span<const uint8_t> data);

    /// Digest of everything written so far. More data may follow.
    [[nodiscard]] core::uint256 digest() const;

    [[nodiscard]] size_t size() const noexcept { return written_; }

private:
    struct CtxFree {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, CtxFree> ctx_;
    size_t written_ = 0;
};

}  // namespace crypto
