// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"
#include "util.h"

#include "chain/utxo/cache.h"
#include "chain/utxo/view.h"
#include "consensus/amount.h"
#include "consensus/sig_check.h"
#include "consensus/topsort.h"
#include "consensus/tx_verify.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <vector>

using consensus::ViolationKind;
using primitives::Coin;
using primitives::OutPoint;
using primitives::Transaction;
using primitives::TxOutAux;
using primitives::TxOutput;

namespace {

/// Resolver backed by a plain map, for tests that need no store.
chain::utxo::InputResolver map_resolver(
    const std::map<OutPoint, TxOutAux>& outputs) {
    return [&outputs](const OutPoint& op) -> std::optional<TxOutAux> {
        auto it = outputs.find(op);
        if (it == outputs.end()) return std::nullopt;
        return it->second;
    };
}

/// A random valid spend: 1-4 inputs owned by random keys, 1-4 outputs
/// whose total does not exceed the inputs.
struct GoodTx {
    std::map<OutPoint, TxOutAux> inputs;
    Transaction tx;
    uint64_t input_total = 0;
};

GoodTx make_good_tx(std::mt19937& rng, const std::vector<crypto::ECKey>& keys,
                    uint32_t id) {
    GoodTx g;
    std::vector<test::Spend> spends;
    size_t n_in = 1 + rng() % 4;
    for (size_t i = 0; i < n_in; ++i) {
        const auto& key = keys[rng() % keys.size()];
        auto op = test::fake_outpoint(id, static_cast<uint32_t>(i));
        uint64_t value = 1 + rng() % 1'000'000;
        g.inputs.emplace(op, TxOutAux(test::output_to(key, value)));
        g.input_total += value;
        spends.push_back({op, &key});
    }

    std::vector<TxOutput> outs;
    size_t n_out = 1 + rng() % 4;
    uint64_t remaining = g.input_total;
    for (size_t i = 0; i < n_out && remaining > 0; ++i) {
        uint64_t value = 1 + rng() % remaining;
        outs.push_back(test::output_to(keys[rng() % keys.size()], value));
        remaining -= value;
    }
    g.tx = test::make_tx(spends, outs);
    return g;
}

std::vector<crypto::ECKey> make_keys(uint32_t first, size_t count) {
    std::vector<crypto::ECKey> keys;
    for (size_t i = 0; i < count; ++i) {
        keys.push_back(test::make_key(first + static_cast<uint32_t>(i)));
    }
    return keys;
}

} // namespace

// ============================================================================
// verify_tx_alone
// ============================================================================

TEST_CASE(VerifyTxAlone, well_formed_transactions_pass) {
    std::mt19937 rng(2024);
    auto keys = make_keys(600, 4);
    for (uint32_t i = 0; i < 25; ++i) {
        auto g = make_good_tx(rng, keys, 1000 + i);
        CHECK_OK(consensus::verify_tx_alone(g.tx));
    }
}

TEST_CASE(VerifyTxAlone, structural_violations) {
    auto key = test::make_key(610);
    auto prev = test::fake_outpoint(1);

    Transaction no_inputs({}, {test::output_to(key, 5)});
    auto r1 = consensus::verify_tx_alone(no_inputs);
    CHECK_ERR(r1);
    CHECK(r1.error().kinds() == std::set<ViolationKind>{ViolationKind::EMPTY_INPUTS});

    Transaction no_outputs({primitives::TxInput(prev)}, {});
    auto r2 = consensus::verify_tx_alone(no_outputs);
    CHECK(r2.error().kinds() == std::set<ViolationKind>{ViolationKind::EMPTY_OUTPUTS});

    Transaction empty;
    auto r3 = consensus::verify_tx_alone(empty);
    CHECK(r3.error().has(ViolationKind::EMPTY_INPUTS));
    CHECK(r3.error().has(ViolationKind::EMPTY_OUTPUTS));

    Transaction zero_out({primitives::TxInput(prev)},
                         {test::output_to(key, 3), test::output_to(key, 0)});
    auto r4 = consensus::verify_tx_alone(zero_out);
    CHECK_EQ(r4.error().violations.size(), 1u);
    CHECK(r4.error().violations[0].kind == ViolationKind::NON_POSITIVE_OUTPUT);
    CHECK(r4.error().violations[0].index == std::optional<size_t>(1));

    Transaction huge_out({primitives::TxInput(prev)},
                         {test::output_to(key, Coin::MAX_COIN + 1)});
    CHECK(consensus::verify_tx_alone(huge_out).error().has(
        ViolationKind::OUTPUT_ABOVE_MAX));

    Transaction dup_in({primitives::TxInput(prev), primitives::TxInput(prev)},
                       {test::output_to(key, 1)});
    CHECK(consensus::verify_tx_alone(dup_in).error().has(
        ViolationKind::DUPLICATE_INPUT));
}

// ============================================================================
// verify_tx
// ============================================================================

TEST_CASE(VerifyTx, good_transactions_verify_with_undo) {
    std::mt19937 rng(99);
    auto keys = make_keys(620, 5);
    for (uint32_t i = 0; i < 20; ++i) {
        auto g = make_good_tx(rng, keys, 2000 + i);
        auto res = consensus::verify_tx(map_resolver(g.inputs), g.tx);
        CHECK_OK(res);
        if (!res) continue;

        const auto& undo = res.value();
        CHECK_EQ(undo.spent.size(), g.tx.vin().size());
        for (size_t j = 0; j < undo.spent.size(); ++j) {
            CHECK(undo.spent[j] == g.inputs.at(g.tx.vin()[j].prevout));
        }
    }
}

TEST_CASE(VerifyTx, overspend_fails_only_with_insufficient_value) {
    std::mt19937 rng(5);
    auto keys = make_keys(630, 3);
    for (uint32_t i = 0; i < 15; ++i) {
        auto g = make_good_tx(rng, keys, 3000 + i);
        std::vector<test::Spend> spends;
        for (const auto& in : g.tx.vin()) {
            auto owner_it = std::find_if(keys.begin(), keys.end(),
                [&](const crypto::ECKey& k) {
                    return test::address_of(k) ==
                           g.inputs.at(in.prevout).out.address;
                });
            spends.push_back({in.prevout, &*owner_it});
        }
        std::vector<TxOutput> outs = {
            test::output_to(keys[0], g.input_total + 1 + rng() % 1000)};
        auto overspend = test::make_tx(spends, outs);

        auto res = consensus::verify_tx(map_resolver(g.inputs), overspend);
        CHECK_ERR(res);
        if (res) continue;
        CHECK(res.error().kinds() ==
              std::set<ViolationKind>{ViolationKind::INSUFFICIENT_VALUE});
    }
}

TEST_CASE(VerifyTx, bad_signature_fails_only_with_bad_signature) {
    std::mt19937 rng(17);
    auto keys = make_keys(640, 3);
    auto stranger = test::make_key(649);
    for (uint32_t i = 0; i < 15; ++i) {
        auto g = make_good_tx(rng, keys, 4000 + i);

        // Re-sign the first input with a key that does not own it.
        std::vector<test::Spend> spends;
        for (size_t j = 0; j < g.tx.vin().size(); ++j) {
            const auto& prevout = g.tx.vin()[j].prevout;
            const crypto::ECKey* signer = &stranger;
            if (j > 0) {
                for (const auto& k : keys) {
                    if (test::address_of(k) == g.inputs.at(prevout).out.address) {
                        signer = &k;
                    }
                }
            }
            spends.push_back({prevout, signer});
        }
        auto forged = test::make_tx(spends, g.tx.vout());
        CHECK_EQ(forged.txid(), g.tx.txid());

        auto res = consensus::verify_tx(map_resolver(g.inputs), forged);
        CHECK_ERR(res);
        if (res) continue;
        CHECK(res.error().kinds() ==
              std::set<ViolationKind>{ViolationKind::BAD_SIGNATURE});
        CHECK(res.error().violations[0].index == std::optional<size_t>(0));
    }
}

TEST_CASE(VerifyTx, signature_does_not_cover_other_outputs) {
    auto key = test::make_key(650);
    auto prev = test::fake_outpoint(50);
    std::map<OutPoint, TxOutAux> inputs = {
        {prev, TxOutAux(test::output_to(key, 100))}};

    auto tx = test::make_tx({{prev, &key}}, {test::output_to(key, 40)});
    // Keep the signature, change the outputs.
    Transaction altered(tx.vin(), {test::output_to(key, 41)});

    auto res = consensus::verify_tx(map_resolver(inputs), altered);
    CHECK_ERR(res);
    if (!res) {
        CHECK(res.error().has(ViolationKind::BAD_SIGNATURE));
    }
}

TEST_CASE(VerifyTx, hundred_coin_input_scenario) {
    auto key = test::make_key(660);
    auto prev = test::fake_outpoint(60);
    TxOutAux hundred(test::output_to(key, 100));
    std::map<OutPoint, TxOutAux> inputs = {{prev, hundred}};

    auto spend40 = test::make_tx({{prev, &key}}, {test::output_to(key, 40)});
    auto ok = consensus::verify_tx(map_resolver(inputs), spend40);
    CHECK_OK(ok);
    if (ok) {
        CHECK_EQ(ok.value().spent.size(), 1u);
        CHECK(ok.value().spent[0] == hundred);
    }

    auto spend150 = test::make_tx({{prev, &key}}, {test::output_to(key, 150)});
    auto bad = consensus::verify_tx(map_resolver(inputs), spend150);
    CHECK_ERR(bad);
    if (!bad) {
        CHECK(bad.error().kinds() ==
              std::set<ViolationKind>{ViolationKind::INSUFFICIENT_VALUE});
    }
}

TEST_CASE(VerifyTx, unresolved_inputs_reported_per_input) {
    auto key = test::make_key(670);
    auto known = test::fake_outpoint(70, 0);
    auto missing1 = test::fake_outpoint(70, 1);
    auto missing2 = test::fake_outpoint(70, 2);
    std::map<OutPoint, TxOutAux> inputs = {
        {known, TxOutAux(test::output_to(key, 10))}};

    auto tx = test::make_tx({{known, &key}, {missing1, &key}, {missing2, &key}},
                            {test::output_to(key, 5)});

    int calls = 0;
    chain::utxo::InputResolver counting =
        [&](const OutPoint& op) -> std::optional<TxOutAux> {
            ++calls;
            return map_resolver(inputs)(op);
        };

    auto res = consensus::verify_tx(counting, tx);
    CHECK_EQ(calls, 3);
    CHECK_ERR(res);
    if (!res) {
        size_t unresolved = 0;
        for (const auto& v : res.error().violations) {
            if (v.kind == ViolationKind::UNRESOLVED_INPUT) ++unresolved;
        }
        CHECK_EQ(unresolved, 2u);
        CHECK(!res.error().has(ViolationKind::BAD_SIGNATURE));
        CHECK(!res.error().has(ViolationKind::INSUFFICIENT_VALUE));
        CHECK(!res.error().format().empty());
    }
}

TEST_CASE(VerifyTx, violations_accumulate_with_structural_errors) {
    auto key = test::make_key(680);
    auto prev = test::fake_outpoint(80);
    std::map<OutPoint, TxOutAux> none;

    Transaction tx({primitives::TxInput(prev)}, {test::output_to(key, 0)});
    auto res = consensus::verify_tx(map_resolver(none), tx);
    CHECK_ERR(res);
    if (!res) {
        CHECK(res.error().has(ViolationKind::NON_POSITIVE_OUTPUT));
        CHECK(res.error().has(ViolationKind::UNRESOLVED_INPUT));
    }
}

TEST_CASE(VerifyTx, store_backed_resolver) {
    auto key = test::make_key(690);
    chain::utxo::UtxoCache cache;
    auto prev = test::fake_outpoint(90);
    cache.add_output(prev, TxOutAux(test::output_to(key, 30)));

    auto tx = test::make_tx({{prev, &key}}, {test::output_to(key, 30)});
    CHECK_OK(consensus::verify_tx(chain::utxo::view_resolver(cache), tx));
    CHECK_ERR(consensus::verify_tx(chain::utxo::empty_resolver(), tx));
}

TEST_CASE(VerifyTx, parallel_signature_checks_agree) {
    std::mt19937 rng(31);
    auto keys = make_keys(700, 4);
    for (uint32_t i = 0; i < 10; ++i) {
        auto g = make_good_tx(rng, keys, 5000 + i);
        auto serial = consensus::verify_tx(map_resolver(g.inputs), g.tx, 1);
        auto parallel = consensus::verify_tx(map_resolver(g.inputs), g.tx, 4);
        CHECK_EQ(serial.ok(), parallel.ok());
    }
}

TEST_CASE(SigCheck, batch_results_per_check) {
    auto key = test::make_key(710);
    auto other = test::make_key(711);
    auto tx = test::make_tx({{test::fake_outpoint(1), &key},
                             {test::fake_outpoint(2), &key},
                             {test::fake_outpoint(3), &other}},
                            {test::output_to(key, 1)});

    std::vector<consensus::SigCheck> checks = {
        {&tx, 0, test::address_of(key)},
        {&tx, 1, test::address_of(other)},
        {&tx, 2, test::address_of(other)},
        {&tx, 7, test::address_of(key)},
    };
    std::vector<uint8_t> expected = {1, 0, 1, 0};
    CHECK_EQ(consensus::check_signatures(checks, 1), expected);
    CHECK_EQ(consensus::check_signatures(checks, 3), expected);
    CHECK_EQ(consensus::check_signatures(checks, 0), expected);
    CHECK(consensus::check_signatures({}, 4).empty());
}

TEST_CASE(Amount, wide_sums_do_not_overflow) {
    std::vector<Coin> coins(1000, Coin(Coin::MAX_COIN));
    auto total = consensus::sum_coins(coins);
    CHECK(total > consensus::WideCoin(Coin::MAX_COIN));
    CHECK_EQ(consensus::wide_to_string(total), "45000000000000000000");
    CHECK_EQ(consensus::wide_to_string(0), "0");
}

// ============================================================================
// Topological sort
// ============================================================================

TEST_CASE(Topsort, independent_transactions_are_permuted) {
    std::mt19937 rng(8);
    auto keys = make_keys(720, 3);
    std::vector<Transaction> txs;
    for (uint32_t i = 0; i < 12; ++i) {
        txs.push_back(make_good_tx(rng, keys, 6000 + i).tx);
    }
    std::shuffle(txs.begin(), txs.end(), rng);

    auto sorted = consensus::topsort_txs(txs);
    CHECK_OK(sorted);
    if (!sorted) return;

    auto ids = [](const std::vector<Transaction>& v) {
        std::vector<core::uint256> out;
        for (const auto& t : v) out.push_back(t.txid());
        std::sort(out.begin(), out.end());
        return out;
    };
    CHECK_EQ(sorted.value().size(), txs.size());
    CHECK(ids(sorted.value()) == ids(txs));
}

TEST_CASE(Topsort, producers_precede_consumers) {
    std::mt19937 rng(77);
    auto key = test::make_key(730);

    for (int round = 0; round < 10; ++round) {
        // Random DAG: each new tx spends outputs of up to two earlier ones.
        std::vector<Transaction> chain_txs;
        for (uint32_t i = 0; i < 15; ++i) {
            std::vector<test::Spend> spends;
            if (i == 0 || rng() % 4 == 0) {
                spends.push_back({test::fake_outpoint(7000 + round * 100 + i),
                                  &key});
            } else {
                size_t parents = 1 + rng() % std::min<size_t>(2, i);
                std::set<size_t> picked;
                while (picked.size() < parents) picked.insert(rng() % i);
                for (size_t p : picked) {
                    spends.push_back({chain_txs[p].outpoint(i % 2), &key});
                }
            }
            chain_txs.push_back(test::make_tx(
                spends, {test::output_to(key, 10), test::output_to(key, 10)}));
        }

        auto shuffled = chain_txs;
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        auto sorted = consensus::topsort_txs(shuffled);
        CHECK_OK(sorted);
        if (!sorted) continue;

        std::map<core::uint256, size_t> position;
        for (size_t i = 0; i < sorted.value().size(); ++i) {
            position[sorted.value()[i].txid()] = i;
        }
        for (const auto& tx : sorted.value()) {
            for (const auto& in : tx.vin()) {
                auto it = position.find(in.prevout.txid);
                if (it != position.end()) {
                    CHECK(it->second < position[tx.txid()]);
                }
            }
        }
    }
}

TEST_CASE(Topsort, lowest_ready_index_goes_first) {
    auto key = test::make_key(735);
    auto a = test::make_tx({{test::fake_outpoint(31), &key}},
                           {test::output_to(key, 1)});
    auto b = test::make_tx({{test::fake_outpoint(32), &key}},
                           {test::output_to(key, 1)});
    auto c = test::make_tx({{b.outpoint(0), &key}}, {test::output_to(key, 1)});

    // c waits for b, so the unrelated a moves ahead of it.
    auto order = consensus::topsort_order({c, a, b});
    CHECK_OK(order);
    if (order) {
        CHECK(order.value() == (std::vector<size_t>{1, 2, 0}));
    }
}

TEST_CASE(Topsort, duplicates_are_kept) {
    auto key = test::make_key(740);
    auto tx = test::make_tx({{test::fake_outpoint(1), &key}},
                            {test::output_to(key, 1)});
    auto sorted = consensus::topsort_txs(std::vector<Transaction>{tx, tx});
    CHECK_OK(sorted);
    CHECK_EQ(sorted.value().size(), 2u);
}

TEST_CASE(Topsort, cycle_is_detected) {
    // 0 -> 1 -> 2 -> 0, plus an independent node 3.
    std::vector<std::vector<size_t>> parents = {{2}, {0}, {1}, {}};
    CHECK(!consensus::topsort_graph(parents).has_value());

    std::vector<std::vector<size_t>> self_loop = {{0}};
    CHECK(!consensus::topsort_graph(self_loop).has_value());

    std::vector<std::vector<size_t>> dag = {{1, 2}, {2}, {}, {0, 0}};
    auto order = consensus::topsort_graph(dag);
    CHECK(order.has_value());
    if (order) {
        CHECK(*order == (std::vector<size_t>{2, 1, 0, 3}));
    }
    CHECK(consensus::topsort_graph({}).value().empty());
}
