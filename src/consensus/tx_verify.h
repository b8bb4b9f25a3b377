#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Transaction-level validation rules
// ---------------------------------------------------------------------------
// verify_tx_alone() -- context-free structural checks
// verify_tx()       -- checks against the unspent-output set, producing the
//                      undo record on success
//
// Both accumulate every violation found instead of stopping at the first.
// ---------------------------------------------------------------------------

#include "chain/undo.h"
#include "chain/utxo/view.h"
#include "core/error.h"
#include "primitives/transaction.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace consensus {

enum class ViolationKind : uint8_t {
    EMPTY_INPUTS,
    EMPTY_OUTPUTS,
    NON_POSITIVE_OUTPUT,
    OUTPUT_ABOVE_MAX,
    DUPLICATE_INPUT,
    UNRESOLVED_INPUT,
    BAD_SIGNATURE,
    INSUFFICIENT_VALUE,
};

[[nodiscard]] std::string_view violation_kind_name(ViolationKind kind) noexcept;

/// One failed property. @c index names the offending input or output when
/// the property is per-element.
struct Violation {
    ViolationKind kind;
    std::optional<size_t> index;
    std::string detail;

    [[nodiscard]] std::string to_string() const;
};

/// Everything that was wrong with a transaction. Never empty when returned
/// as an error.
struct TxVerifyFailure {
    std::vector<Violation> violations;

    [[nodiscard]] bool has(ViolationKind kind) const;
    [[nodiscard]] std::set<ViolationKind> kinds() const;

    /// "; "-joined description of every violation.
    [[nodiscard]] std::string format() const;
};

/// Context-free checks:
///   - vin must not be empty
///   - vout must not be empty
///   - every output coin must be positive and at most MAX_COIN
///   - no two inputs may reference the same output
[[nodiscard]] core::Result<void, TxVerifyFailure> verify_tx_alone(
    const primitives::Transaction& tx);

/// Full verification against @p resolver:
///   1. every verify_tx_alone() check
///   2. every input resolves to an unspent output (resolver called once per
///      input, in input order)
///   3. every resolved input carries a valid signature by the owner of the
///      output it spends
///   4. resolved input value >= output value
///
/// On success returns the resolved outputs in input order.
/// @p sig_check_threads is passed to check_signatures().
[[nodiscard]] core::Result<chain::TxUndo, TxVerifyFailure> verify_tx(
    const chain::utxo::InputResolver& resolver,
    const primitives::Transaction& tx,
    int sig_check_threads = 1);

} // namespace consensus
