// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/keccak.h"

#include <array>
#include <stdexcept>

#include <openssl/evp.h>

namespace crypto {

void Keccak256Hasher::CtxFree::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Keccak256Hasher::Keccak256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("keccak256: EVP_MD_CTX_new() failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha3_256(), nullptr) != 1) {
        throw std::runtime_error("keccak256: EVP_DigestInit_ex() failed");
    }
}

Keccak256Hasher::~Keccak256Hasher() = default;
Keccak256Hasher::Keccak256Hasher(Keccak256Hasher&&) noexcept = default;
Keccak256Hasher& Keccak256Hasher::operator=(Keccak256Hasher&&) noexcept = default;

void Keccak256Hasher::write(std::span<const uint8_t> data) {
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("keccak256: EVP_DigestUpdate() failed");
    }
    written_ += data.size();
}

core::uint256 Keccak256Hasher::digest() const {
    // Finalise a copy so the running state stays usable.
    std::unique_ptr<evp_md_ctx_st, CtxFree> copy(EVP_MD_CTX_new());
    if (!copy || EVP_MD_CTX_copy_ex(copy.get(), ctx_.get()) != 1) {
        throw std::runtime_error("keccak256: EVP_MD_CTX_copy_ex() failed");
    }

    std::array<uint8_t, 32> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(copy.get(), out.data(), &len) != 1 ||
        len != out.size()) {
        throw std::runtime_error("keccak256: EVP_DigestFinal_ex() failed");
    }
    return core::uint256::from_bytes(out);
}

core::uint256 keccak256(std::span<const uint8_t> data) {
    Keccak256Hasher hasher;
    hasher.write(data);
    return hasher.digest();
}

core::uint256 keccak256d(std::span<const uint8_t> data) {
    return keccak256(keccak256(data).span());
}

core::uint160 hash160(std::span<const uint8_t> data) {
    core::uint256 full = keccak256d(data);
    return core::uint160::from_bytes(
        std::span<const uint8_t, 20>(full.data(), 20));
}

}  // namespace crypto
