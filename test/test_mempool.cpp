// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"
#include "util.h"

#include "mempool/mempool.h"

#include <algorithm>
#include <cstdint>
#include <random>
#include <set>
#include <vector>

namespace {

primitives::TxAux pool_tx(uint32_t id) {
    static const crypto::ECKey key = test::make_key(800);
    return primitives::TxAux(test::make_tx(
        {{test::fake_outpoint(id), &key}}, {test::output_to(key, 1 + id)}));
}

} // namespace

TEST_CASE(MemPool, insert_and_lookup) {
    mempool::MemPool pool;
    CHECK(pool.empty());

    auto tx = pool_tx(1);
    CHECK(pool.insert(tx));
    CHECK_EQ(pool.size(), 1u);
    CHECK(pool.contains(tx.txid()));
    CHECK(pool.get(tx.txid()) == std::optional<primitives::TxAux>(tx));
    CHECK(!pool.get(pool_tx(2).txid()).has_value());
}

TEST_CASE(MemPool, duplicate_insert_is_noop) {
    mempool::MemPool pool;
    auto tx = pool_tx(3);
    CHECK(pool.insert(tx));
    CHECK(!pool.insert(tx));
    CHECK_EQ(pool.size(), 1u);
    CHECK_EQ(pool.entries().size(), 1u);
}

TEST_CASE(MemPool, remove_missing_returns_false) {
    mempool::MemPool pool;
    auto tx = pool_tx(4);
    CHECK(!pool.remove(tx.txid()));
    pool.insert(tx);
    CHECK(pool.remove(tx.txid()));
    CHECK(!pool.remove(tx.txid()));
    CHECK(pool.empty());
}

TEST_CASE(MemPool, size_tracks_distinct_entries) {
    std::mt19937 rng(4242);
    std::vector<primitives::TxAux> candidates;
    for (uint32_t i = 0; i < 30; ++i) candidates.push_back(pool_tx(100 + i));

    mempool::MemPool pool;
    std::set<core::uint256> model;
    for (int step = 0; step < 500; ++step) {
        const auto& tx = candidates[rng() % candidates.size()];
        if (rng() % 3 == 0) {
            bool removed = pool.remove(tx.txid());
            CHECK_EQ(removed, model.erase(tx.txid()) == 1);
        } else {
            bool inserted = pool.insert(tx);
            CHECK_EQ(inserted, model.insert(tx.txid()).second);
        }
        CHECK_EQ(pool.size(), model.size());
        CHECK_EQ(pool.entries().size(), model.size());
    }

    auto ids = pool.txids();
    std::sort(ids.begin(), ids.end());
    CHECK(ids == std::vector<core::uint256>(model.begin(), model.end()));
    CHECK_EQ(pool.all().size(), model.size());

    pool.clear();
    CHECK(pool.empty());
    CHECK(pool.txids().empty());
}
