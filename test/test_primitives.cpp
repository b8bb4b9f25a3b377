// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"
#include "util.h"

#include "core/stream.h"
#include "primitives/address.h"
#include "primitives/coin.h"
#include "primitives/outpoint.h"
#include "primitives/transaction.h"
#include "primitives/txin.h"
#include "primitives/txout.h"

#include <cstdint>
#include <stdexcept>
#include <vector>

using primitives::Coin;

// ============================================================================
// Coin
// ============================================================================

TEST_CASE(Coin, construction_and_range) {
    CHECK(Coin().is_zero());
    CHECK_EQ(primitives::ZERO_COIN.value(), 0u);
    CHECK_EQ(Coin::MAX_COIN, 45'000'000'000'000'000ULL);

    CHECK_OK(Coin::from_value(Coin::MAX_COIN));
    CHECK_ERR_CODE(Coin::from_value(Coin::MAX_COIN + 1),
                   core::ErrorCode::VALIDATION_RANGE);
    CHECK(!Coin(Coin::MAX_COIN + 1).is_valid());
}

TEST_CASE(Coin, checked_arithmetic) {
    auto sum = Coin(40) + Coin(60);
    CHECK_OK(sum);
    CHECK_EQ(sum.value(), Coin(100));

    CHECK_ERR_CODE(Coin(Coin::MAX_COIN) + Coin(1),
                   core::ErrorCode::VALIDATION_RANGE);

    auto diff = Coin(100) - Coin(40);
    CHECK_EQ(diff.value().value(), 60u);
    CHECK_ERR_CODE(Coin(40) - Coin(100), core::ErrorCode::VALIDATION_UNDERFLOW);

    CHECK(Coin(1) < Coin(2));
    CHECK_EQ(Coin(12345).to_string(), "12345");
}

TEST_CASE(Coin, deserialize_rejects_above_max) {
    core::DataStream ds;
    core::ser_write_u64(ds, Coin::MAX_COIN + 1);
    CHECK_THROWS(Coin::deserialize(ds), std::runtime_error);
}

// ============================================================================
// Address
// ============================================================================

TEST_CASE(Address, stakeholder_id_is_hash160_of_key) {
    auto key = test::make_key(21);
    auto addr = test::address_of(key);
    CHECK(addr.is_valid());
    CHECK_EQ(addr.stakeholder_id(), crypto::hash160(addr.pubkey()));
    CHECK_EQ(addr.to_string(), addr.stakeholder_id().to_hex());
    CHECK(!primitives::Address().is_valid());
}

TEST_CASE(Address, verify_uses_address_key) {
    auto key = test::make_key(22);
    auto other = test::make_key(23);
    auto hash = crypto::keccak256(key.pubkey_compressed());
    auto sig = key.sign(hash).value();
    CHECK(test::address_of(key).verify(hash, sig));
    CHECK(!test::address_of(other).verify(hash, sig));
}

// ============================================================================
// OutPoint
// ============================================================================

TEST_CASE(OutPoint, equality_ordering_and_text) {
    auto a = test::fake_outpoint(1, 0);
    auto b = test::fake_outpoint(1, 1);
    auto c = test::fake_outpoint(2, 0);
    CHECK_EQ(a, test::fake_outpoint(1, 0));
    CHECK_NE(a, b);
    CHECK_NE(a, c);
    CHECK(a < b);
    CHECK_EQ(b.to_string(), b.txid.to_hex() + ":1");

    core::DataStream ds;
    a.serialize(ds);
    CHECK_EQ(ds.size(), 36u);
    CHECK_EQ(primitives::OutPoint::deserialize(ds), a);
}

// ============================================================================
// TxOutAux / distributions
// ============================================================================

TEST_CASE(TxOutAux, empty_distribution_goes_to_owner) {
    auto key = test::make_key(31);
    auto out = test::output_to(key, 500);
    auto shares = primitives::TxOutAux(out).shares();
    CHECK_EQ(shares.size(), 1u);
    CHECK_EQ(shares[0].first, test::address_of(key).stakeholder_id());
    CHECK_EQ(shares[0].second, Coin(500));
}

TEST_CASE(TxOutAux, explicit_distribution_must_match_coin) {
    auto key = test::make_key(32);
    auto out = test::output_to(key, 100);
    auto s1 = test::address_of(test::make_key(33)).stakeholder_id();
    auto s2 = test::address_of(test::make_key(34)).stakeholder_id();

    primitives::TxOutDistribution good = {{s1, Coin(30)}, {s2, Coin(70)}};
    primitives::TxOutDistribution bad = {{s1, Coin(30)}, {s2, Coin(60)}};
    CHECK_OK(primitives::check_distribution(out, good));
    CHECK_ERR_CODE(primitives::check_distribution(out, bad),
                   core::ErrorCode::VALIDATION_RANGE);
    CHECK_EQ(primitives::stake_shares(out, good), good);
}

TEST_CASE(TxOutAux, serialization_keeps_distribution) {
    auto key = test::make_key(35);
    auto s1 = test::address_of(test::make_key(36)).stakeholder_id();
    primitives::TxOutAux aux(test::output_to(key, 9), {{s1, Coin(9)}});

    core::DataStream ds;
    aux.serialize(ds);
    CHECK_EQ(primitives::TxOutAux::deserialize(ds), aux);
    CHECK(ds.eof());
}

// ============================================================================
// Transaction
// ============================================================================

TEST_CASE(Transaction, txid_ignores_signatures) {
    auto key = test::make_key(41);
    auto prev = test::fake_outpoint(100);
    std::vector<primitives::TxOutput> outs = {test::output_to(key, 10)};

    auto signed_tx = test::make_tx({{prev, &key}}, outs);
    primitives::Transaction unsigned_tx({primitives::TxInput(prev)}, outs);
    CHECK_EQ(signed_tx.txid(), unsigned_tx.txid());
    CHECK(!(signed_tx == unsigned_tx));

    primitives::Transaction other({primitives::TxInput(prev)},
                                  {test::output_to(key, 11)});
    CHECK_NE(other.txid(), unsigned_tx.txid());
    CHECK_EQ(signed_tx.outpoint(0), primitives::OutPoint(signed_tx.txid(), 0));
}

TEST_CASE(Transaction, serialization_roundtrip_keeps_id) {
    auto key = test::make_key(42);
    auto tx = test::make_tx({{test::fake_outpoint(1), &key},
                             {test::fake_outpoint(2), &key}},
                            {test::output_to(key, 5), test::output_to(key, 6)});
    core::DataStream ds;
    tx.serialize(ds);
    auto decoded = primitives::Transaction::deserialize(ds);
    CHECK_EQ(decoded, tx);
    CHECK_EQ(decoded.txid(), tx.txid());
}

TEST_CASE(Transaction, signature_hash_covers_outputs_and_prevout) {
    auto key = test::make_key(43);
    auto prev = test::fake_outpoint(7);
    std::vector<primitives::TxOutput> outs = {test::output_to(key, 1)};
    std::vector<primitives::TxOutput> more = {test::output_to(key, 2)};

    auto h = primitives::input_sig_hash(prev, outs);
    CHECK_EQ(h, primitives::input_sig_hash(prev, outs));
    CHECK_NE(h, primitives::input_sig_hash(prev, more));
    CHECK_NE(h, primitives::input_sig_hash(test::fake_outpoint(7, 1), outs));
}

TEST_CASE(TxAux, distributions_checked_per_output) {
    auto key = test::make_key(44);
    auto s1 = test::address_of(test::make_key(45)).stakeholder_id();
    auto tx = test::make_tx({{test::fake_outpoint(3), &key}},
                            {test::output_to(key, 8), test::output_to(key, 2)});

    CHECK_OK(primitives::TxAux(tx).check_distributions());
    CHECK_OK(primitives::TxAux(tx, {{{s1, Coin(8)}}, {}}).check_distributions());
    CHECK_ERR(primitives::TxAux(
        tx, std::vector<primitives::TxOutDistribution>(1)).check_distributions());
    CHECK_ERR_CODE(
        primitives::TxAux(tx, {{{s1, Coin(7)}}, {}}).check_distributions(),
        core::ErrorCode::VALIDATION_RANGE);

    primitives::TxAux aux(tx, {{{s1, Coin(8)}}, {}});
    CHECK_EQ(aux.output_aux(0).distribution.size(), 1u);
    CHECK(aux.output_aux(1).distribution.empty());
    CHECK(primitives::TxAux(tx).distribution(5).empty());
}
