// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/tx_verify.h"

#include "consensus/amount.h"
#include "consensus/sig_check.h"
#include "core/logging.h"
#include "primitives/coin.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace consensus {

std::string_view violation_kind_name(ViolationKind kind) noexcept {
    switch (kind) {
        case ViolationKind::EMPTY_INPUTS:        return "empty-inputs";
        case ViolationKind::EMPTY_OUTPUTS:       return "empty-outputs";
        case ViolationKind::NON_POSITIVE_OUTPUT: return "non-positive-output";
        case ViolationKind::OUTPUT_ABOVE_MAX:    return "output-above-max";
        case ViolationKind::DUPLICATE_INPUT:     return "duplicate-input";
        case ViolationKind::UNRESOLVED_INPUT:    return "unknown-or-spent-input";
        case ViolationKind::BAD_SIGNATURE:       return "bad-signature";
        case ViolationKind::INSUFFICIENT_VALUE:  return "insufficient-input-value";
    }
    return "unknown";
}

std::string Violation::to_string() const {
    std::string s(violation_kind_name(kind));
    if (index) {
        s += "[" + std::to_string(*index) + "]";
    }
    if (!detail.empty()) {
        s += ": " + detail;
    }
    return s;
}

bool TxVerifyFailure::has(ViolationKind kind) const {
    return std::any_of(violations.begin(), violations.end(),
                       [kind](const Violation& v) { return v.kind == kind; });
}

std::set<ViolationKind> TxVerifyFailure::kinds() const {
    std::set<ViolationKind> result;
    for (const auto& v : violations) {
        result.insert(v.kind);
    }
    return result;
}

std::string TxVerifyFailure::format() const {
    std::string s;
    for (const auto& v : violations) {
        if (!s.empty()) s += "; ";
        s += v.to_string();
    }
    return s;
}

// ---------------------------------------------------------------------------
// Structural checks
// ---------------------------------------------------------------------------

namespace {

void check_structure(const primitives::Transaction& tx,
                     std::vector<Violation>& out) {
    if (tx.vin().empty()) {
        out.push_back({ViolationKind::EMPTY_INPUTS, std::nullopt,
                       "transaction has no inputs"});
    }
    if (tx.vout().empty()) {
        out.push_back({ViolationKind::EMPTY_OUTPUTS, std::nullopt,
                       "transaction has no outputs"});
    }
    for (size_t i = 0; i < tx.vout().size(); ++i) {
        const auto& coin = tx.vout()[i].coin;
        if (coin.is_zero()) {
            out.push_back({ViolationKind::NON_POSITIVE_OUTPUT, i,
                           "output coin is zero"});
        } else if (!coin.is_valid()) {
            out.push_back({ViolationKind::OUTPUT_ABOVE_MAX, i,
                           "output coin " + coin.to_string() +
                           " exceeds MAX_COIN"});
        }
    }

    std::unordered_set<primitives::OutPoint> seen;
    for (size_t i = 0; i < tx.vin().size(); ++i) {
        if (!seen.insert(tx.vin()[i].prevout).second) {
            out.push_back({ViolationKind::DUPLICATE_INPUT, i,
                           tx.vin()[i].prevout.to_string()});
        }
    }
}

} // namespace

core::Result<void, TxVerifyFailure> verify_tx_alone(
    const primitives::Transaction& tx) {
    TxVerifyFailure failure;
    check_structure(tx, failure.violations);
    if (!failure.violations.empty()) {
        return failure;
    }
    return {};
}

// ---------------------------------------------------------------------------
// Full verification
// ---------------------------------------------------------------------------

core::Result<chain::TxUndo, TxVerifyFailure> verify_tx(
    const chain::utxo::InputResolver& resolver,
    const primitives::Transaction& tx,
    int sig_check_threads) {
    TxVerifyFailure failure;
    check_structure(tx, failure.violations);

    // Resolve each input exactly once.
    const auto& vin = tx.vin();
    std::vector<std::optional<primitives::TxOutAux>> resolved;
    resolved.reserve(vin.size());
    for (size_t i = 0; i < vin.size(); ++i) {
        resolved.push_back(resolver(vin[i].prevout));
        if (!resolved.back()) {
            failure.violations.push_back({ViolationKind::UNRESOLVED_INPUT, i,
                                          vin[i].prevout.to_string()});
        }
    }

    std::vector<SigCheck> checks;
    for (size_t i = 0; i < vin.size(); ++i) {
        if (resolved[i]) {
            checks.push_back({&tx, i, resolved[i]->out.address});
        }
    }
    auto sig_results = check_signatures(checks, sig_check_threads);
    for (size_t c = 0; c < checks.size(); ++c) {
        if (!sig_results[c]) {
            size_t i = checks[c].input_index;
            failure.violations.push_back({ViolationKind::BAD_SIGNATURE, i,
                "not signed by " + checks[c].address.to_string()});
        }
    }

    WideCoin input_sum = 0;
    for (const auto& r : resolved) {
        if (r) input_sum += r->out.coin.value();
    }
    WideCoin output_sum = sum_outputs(tx.vout());
    if (input_sum < output_sum) {
        failure.violations.push_back({ViolationKind::INSUFFICIENT_VALUE,
            std::nullopt,
            "inputs " + wide_to_string(input_sum) + " < outputs " +
            wide_to_string(output_sum)});
    }

    if (!failure.violations.empty()) {
        LOG_DEBUG(core::LogCategory::VALIDATION,
                  "verify_tx: " + tx.txid().to_hex() + " rejected: " +
                  failure.format());
        return failure;
    }

    chain::TxUndo undo;
    undo.spent.reserve(resolved.size());
    for (auto& r : resolved) {
        undo.spent.push_back(std::move(*r));
    }
    return undo;
}

} // namespace consensus
