// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/sig_check.h"

#include "core/logging.h"
#include "core/thread.h"

#include <algorithm>
#include <atomic>
#include <string>

namespace consensus {

// ---------------------------------------------------------------------------
// SigCheck::operator()  --  verify one input
// ---------------------------------------------------------------------------

bool SigCheck::operator()() const {
    if (!tx || input_index >= tx->vin().size()) {
        return false;
    }

    const auto& input = tx->vin()[input_index];
    core::uint256 hash = primitives::input_sig_hash(input.prevout, tx->vout());
    bool ok = address.verify(hash, input.signature);

    if (!ok) {
        LOG_TRACE(core::LogCategory::CRYPTO,
                  "Signature check failed for input " +
                  std::to_string(input_index) + " of tx " +
                  tx->txid().to_hex());
    }
    return ok;
}

// ---------------------------------------------------------------------------
// check_signatures
// ---------------------------------------------------------------------------

std::vector<uint8_t> check_signatures(const std::vector<SigCheck>& checks,
                                      int num_threads) {
    std::vector<uint8_t> results(checks.size(), 0);

    if (num_threads <= 0) {
        num_threads = core::get_num_cores();
    }

    if (num_threads <= 1 || checks.size() < 2) {
        for (size_t i = 0; i < checks.size(); ++i) {
            results[i] = checks[i]() ? 1 : 0;
        }
        return results;
    }

    size_t workers = std::min(static_cast<size_t>(num_threads), checks.size());
    std::atomic<size_t> next{0};

    core::ThreadGroup group;
    for (size_t w = 0; w < workers; ++w) {
        group.create_thread("sigcheck." + std::to_string(w),
            [&checks, &results, &next]() {
                for (;;) {
                    size_t i = next.fetch_add(1, std::memory_order_relaxed);
                    if (i >= checks.size()) break;
                    results[i] = checks[i]() ? 1 : 0;
                }
            });
    }
    group.join_all();

    LOG_TRACE(core::LogCategory::BENCH,
              "Checked " + std::to_string(checks.size()) +
              " signatures on " + std::to_string(workers) + " threads");
    return results;
}

} // namespace consensus
