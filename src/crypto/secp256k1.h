#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "core/error.h"
#include "core/types.h"

typedef struct evp_pkey_st EVP_PKEY;

namespace crypto {

/// Size of a SEC1 compressed public key.
inline constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;

using PubKey = std::array<uint8_t, COMPRESSED_PUBKEY_SIZE>;

/// ECDSA key pair on the secp256k1 curve, built on the OpenSSL 3 EVP API.
class ECKey {
public:
    ECKey();
    ~ECKey();

    ECKey(const ECKey&) = delete;
    ECKey& operator=(const ECKey&) = delete;

    ECKey(ECKey&& other) noexcept;
    ECKey& operator=(ECKey&& other) noexcept;

    /// Fresh random key pair.
    static core::Result<ECKey> generate();

    /// Key from a 32-byte big-endian scalar. Fails with CRYPTO_KEY_FAIL
    /// when the scalar is zero or not below the curve order.
    static core::Result<ECKey> from_secret(std::span<const uint8_t, 32> secret);

    [[nodiscard]] bool is_valid() const noexcept { return pkey_ != nullptr; }

    /// SEC1 compressed public key (0x02/0x03 || x).
    [[nodiscard]] PubKey pubkey_compressed() const;

    /// DER-encoded ECDSA signature over a 32-byte digest, normalised to
    /// low-S. Returns CRYPTO_SIG_FAIL if OpenSSL refuses to sign.
    [[nodiscard]] core::Result<std::vector<uint8_t>> sign(
        const core::uint256& hash) const;

    /// Verify a DER signature over @p hash under a SEC1 public key.
    /// Malformed keys or signatures verify as false.
    static bool verify(std::span<const uint8_t> pubkey,
                       const core::uint256& hash,
                       std::span<const uint8_t> der_sig);

private:
    struct PKeyDeleter {
        void operator()(EVP_PKEY* p) const;
    };

    std::unique_ptr<EVP_PKEY, PKeyDeleter> pkey_;
};

/// Rewrite S to the lower half of the curve order. Returns true if the
/// signature was changed.
bool ecdsa_normalize_s(std::vector<uint8_t>& der_sig);

/// True for a 33-byte compressed or 65-byte uncompressed SEC1 encoding of
/// a point on the curve.
bool is_valid_pubkey(std::span<const uint8_t> pubkey);

}  // namespace crypto
