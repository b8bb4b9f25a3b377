// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/secp256k1.h"
#include "core/logging.h"

#include <algorithm>
#include <utility>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>

namespace crypto {

namespace {

template <auto FreeFn>
struct OsslFree {
    template <typename T>
    void operator()(T* p) const { FreeFn(p); }
};

template <typename T, auto FreeFn>
using Owned = std::unique_ptr<T, OsslFree<FreeFn>>;

using BigNum = Owned<BIGNUM, BN_clear_free>;
using BnCtx = Owned<BN_CTX, BN_CTX_free>;
using Group = Owned<EC_GROUP, EC_GROUP_free>;
using Point = Owned<EC_POINT, EC_POINT_free>;
using PKeyCtx = Owned<EVP_PKEY_CTX, EVP_PKEY_CTX_free>;
using ParamBuilder = Owned<OSSL_PARAM_BLD, OSSL_PARAM_BLD_free>;
using Params = Owned<OSSL_PARAM, OSSL_PARAM_free>;
using Signature = Owned<ECDSA_SIG, ECDSA_SIG_free>;

constexpr const char* CURVE_NAME = "secp256k1";
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

const EC_GROUP* curve() {
    static const Group group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
    return group.get();
}

const BIGNUM* curve_order() {
    return EC_GROUP_get0_order(curve());
}

// (n - 1) / 2: the largest S accepted as low.
const BIGNUM* half_order() {
    static const BigNum half = [] {
        BigNum h{BN_dup(curve_order())};
        if (h) BN_rshift1(h.get(), h.get());
        return h;
    }();
    return half.get();
}

/// Starts a parameter set for a key on this curve.
ParamBuilder curve_params() {
    ParamBuilder bld{OSSL_PARAM_BLD_new()};
    if (bld && !OSSL_PARAM_BLD_push_utf8_string(
                   bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, CURVE_NAME, 0)) {
        bld.reset();
    }
    return bld;
}

EVP_PKEY* import_key(OSSL_PARAM_BLD* bld, int selection) {
    Params params{OSSL_PARAM_BLD_to_param(bld)};
    PKeyCtx ctx{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)};
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
        return nullptr;
    }
    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &pkey, selection, params.get()) <= 0) {
        return nullptr;
    }
    return pkey;
}

/// Uncompressed encoding of secret * G, empty on failure.
std::vector<uint8_t> derive_pubkey(const BIGNUM* secret) {
    BnCtx ctx{BN_CTX_new()};
    Point point{EC_POINT_new(curve())};
    if (!ctx || !point ||
        !EC_POINT_mul(curve(), point.get(), secret, nullptr, nullptr,
                      ctx.get())) {
        return {};
    }
    std::vector<uint8_t> out(UNCOMPRESSED_PUBKEY_SIZE);
    size_t len = EC_POINT_point2oct(curve(), point.get(),
                                    POINT_CONVERSION_UNCOMPRESSED, out.data(),
                                    out.size(), ctx.get());
    if (len != out.size()) return {};
    return out;
}

EVP_PKEY* import_keypair(const BIGNUM* secret) {
    // The builder references secret and pub until to_param() copies them.
    std::vector<uint8_t> pub = derive_pubkey(secret);
    ParamBuilder bld = curve_params();
    if (pub.empty() || !bld ||
        !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, secret) ||
        !OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                          pub.data(), pub.size())) {
        return nullptr;
    }
    return import_key(bld.get(), EVP_PKEY_KEYPAIR);
}

EVP_PKEY* import_pubkey(std::span<const uint8_t> pub) {
    ParamBuilder bld = curve_params();
    if (!bld ||
        !OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                          pub.data(), pub.size())) {
        return nullptr;
    }
    return import_key(bld.get(), EVP_PKEY_PUBLIC_KEY);
}

} // namespace

void ECKey::PKeyDeleter::operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }

ECKey::ECKey() = default;
ECKey::~ECKey() = default;
ECKey::ECKey(ECKey&& other) noexcept = default;
ECKey& ECKey::operator=(ECKey&& other) noexcept = default;

core::Result<ECKey> ECKey::generate() {
    ECKey key;
    key.pkey_.reset(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", CURVE_NAME));
    if (!key.pkey_) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
                                "key generation failed");
    }
    return key;
}

core::Result<ECKey> ECKey::from_secret(std::span<const uint8_t, 32> secret) {
    BigNum scalar{BN_bin2bn(secret.data(), static_cast<int>(secret.size()),
                            nullptr)};
    if (!scalar || BN_is_zero(scalar.get()) ||
        BN_cmp(scalar.get(), curve_order()) >= 0) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
                                "secret is not in [1, n-1]");
    }

    ECKey key;
    key.pkey_.reset(import_keypair(scalar.get()));
    if (!key.pkey_) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
                                "could not import secret key");
    }
    return key;
}

PubKey ECKey::pubkey_compressed() const {
    PubKey out{};
    uint8_t full[UNCOMPRESSED_PUBKEY_SIZE];
    size_t len = 0;
    if (!pkey_ ||
        !EVP_PKEY_get_octet_string_param(pkey_.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                         full, sizeof(full), &len) ||
        len != sizeof(full)) {
        return out;
    }
    // 0x04 || x || y  ->  (0x02 | parity(y)) || x
    out[0] = static_cast<uint8_t>(0x02 | (full[64] & 1));
    std::copy(full + 1, full + 33, out.begin() + 1);
    return out;
}

core::Result<std::vector<uint8_t>> ECKey::sign(
    const core::uint256& hash) const {
    if (!pkey_) {
        return core::make_error(core::ErrorCode::CRYPTO_SIG_FAIL,
                                "no key to sign with");
    }

    PKeyCtx ctx{EVP_PKEY_CTX_new_from_pkey(nullptr, pkey_.get(), nullptr)};
    size_t max_len = 0;
    if (!ctx || EVP_PKEY_sign_init(ctx.get()) <= 0 ||
        EVP_PKEY_sign(ctx.get(), nullptr, &max_len, hash.data(),
                      hash.size()) <= 0) {
        return core::make_error(core::ErrorCode::CRYPTO_SIG_FAIL,
                                "signing context setup failed");
    }

    std::vector<uint8_t> sig(max_len);
    size_t sig_len = max_len;
    if (EVP_PKEY_sign(ctx.get(), sig.data(), &sig_len, hash.data(),
                      hash.size()) <= 0) {
        return core::make_error(core::ErrorCode::CRYPTO_SIG_FAIL,
                                "signing failed");
    }
    sig.resize(sig_len);
    ecdsa_normalize_s(sig);
    return sig;
}

bool ECKey::verify(std::span<const uint8_t> pubkey,
                   const core::uint256& hash,
                   std::span<const uint8_t> der_sig) {
    if (der_sig.empty() || !is_valid_pubkey(pubkey)) return false;

    std::unique_ptr<EVP_PKEY, PKeyDeleter> key{import_pubkey(pubkey)};
    if (!key) return false;

    PKeyCtx ctx{EVP_PKEY_CTX_new_from_pkey(nullptr, key.get(), nullptr)};
    if (!ctx || EVP_PKEY_verify_init(ctx.get()) <= 0) {
        LOG_WARN(core::LogCategory::CRYPTO, "cannot set up signature check");
        return false;
    }
    return EVP_PKEY_verify(ctx.get(), der_sig.data(), der_sig.size(),
                           hash.data(), hash.size()) == 1;
}

bool ecdsa_normalize_s(std::vector<uint8_t>& der_sig) {
    const uint8_t* cursor = der_sig.data();
    Signature sig{d2i_ECDSA_SIG(nullptr, &cursor,
                                static_cast<long>(der_sig.size()))};
    if (!sig) return false;

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);
    if (BN_cmp(s, half_order()) <= 0) return false;

    BigNum new_r{BN_dup(r)};
    BigNum new_s{BN_new()};
    if (!new_r || !new_s || !BN_sub(new_s.get(), curve_order(), s) ||
        !ECDSA_SIG_set0(sig.get(), new_r.get(), new_s.get())) {
        return false;
    }
    // Owned by sig now.
    new_r.release();
    new_s.release();

    unsigned char* encoded = nullptr;
    int len = i2d_ECDSA_SIG(sig.get(), &encoded);
    if (len <= 0) return false;
    der_sig.assign(encoded, encoded + len);
    OPENSSL_free(encoded);
    return true;
}

bool is_valid_pubkey(std::span<const uint8_t> pubkey) {
    if (pubkey.empty()) return false;
    const uint8_t prefix = pubkey[0];
    const bool compressed = pubkey.size() == COMPRESSED_PUBKEY_SIZE &&
                            (prefix == 0x02 || prefix == 0x03);
    const bool uncompressed =
        pubkey.size() == UNCOMPRESSED_PUBKEY_SIZE && prefix == 0x04;
    if (!compressed && !uncompressed) return false;

    BnCtx ctx{BN_CTX_new()};
    Point point{EC_POINT_new(curve())};
    return ctx && point &&
           EC_POINT_oct2point(curve(), point.get(), pubkey.data(),
                              pubkey.size(), ctx.get()) == 1 &&
           EC_POINT_is_on_curve(curve(), point.get(), ctx.get()) == 1;
}

}  // namespace crypto
