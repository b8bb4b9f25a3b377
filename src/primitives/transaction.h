#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/types.h"
#include "crypto/secp256k1.h"
#include "primitives/outpoint.h"
#include "primitives/txin.h"
#include "primitives/txout.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// Transaction -- immutable list of inputs and outputs
// ---------------------------------------------------------------------------
// The id is keccak256d over the input references and the outputs.
// Signatures are not covered, so a transaction keeps its id when its
// inputs are re-signed. The id is computed once at construction.
// ---------------------------------------------------------------------------
class Transaction {
public:
    Transaction() : Transaction({}, {}) {}
    Transaction(std::vector<TxInput> vin, std::vector<TxOutput> vout);

    [[nodiscard]] const std::vector<TxInput>& vin() const { return vin_; }
    [[nodiscard]] const std::vector<TxOutput>& vout() const { return vout_; }
    [[nodiscard]] const core::uint256& txid() const { return txid_; }

    /// Outpoint naming output @p index of this transaction.
    [[nodiscard]] OutPoint outpoint(uint32_t index) const {
        return OutPoint(txid_, index);
    }

    /// Full encoding including signatures.
    template <typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_obj_vector(s, vin_);
        core::ser_write_obj_vector(s, vout_);
    }

    /// Throws std::runtime_error on truncated or malformed input.
    template <typename Stream>
    static Transaction deserialize(Stream& s) {
        auto vin = core::ser_read_obj_vector<TxInput>(s);
        auto vout = core::ser_read_obj_vector<TxOutput>(s);
        return Transaction(std::move(vin), std::move(vout));
    }

    /// Equal ids and equal signatures.
    bool operator==(const Transaction& other) const {
        return txid_ == other.txid_ && vin_ == other.vin_;
    }

private:
    std::vector<TxInput> vin_;
    std::vector<TxOutput> vout_;
    core::uint256 txid_;
};

/// Digest signed by the owner of the output @p prevout refers to: the
/// referenced txid, the referenced index and every output of the spending
/// transaction.
[[nodiscard]] core::uint256 input_sig_hash(const OutPoint& prevout,
                                           const std::vector<TxOutput>& outputs);

/// Signature over input_sig_hash(prevout, outputs) with @p key.
[[nodiscard]] core::Result<std::vector<uint8_t>> sign_input(
    const crypto::ECKey& key,
    const OutPoint& prevout,
    const std::vector<TxOutput>& outputs);

// ---------------------------------------------------------------------------
// TxAux -- transaction plus per-output stake distributions
// ---------------------------------------------------------------------------
struct TxAux {
    Transaction tx;
    /// Empty, or one entry per output of tx.
    std::vector<TxOutDistribution> distributions;

    TxAux() = default;
    explicit TxAux(Transaction tx_in,
                   std::vector<TxOutDistribution> dists = {})
        : tx(std::move(tx_in)), distributions(std::move(dists)) {}

    [[nodiscard]] const core::uint256& txid() const { return tx.txid(); }

    /// Distribution attached to output @p index (empty if none).
    [[nodiscard]] const TxOutDistribution& distribution(size_t index) const;

    /// Output @p index together with its distribution.
    [[nodiscard]] TxOutAux output_aux(size_t index) const {
        return TxOutAux(tx.vout()[index], distribution(index));
    }

    /// Distribution list length must be 0 or the output count, and each
    /// distribution must match its output (see check_distribution).
    [[nodiscard]] core::Result<void> check_distributions() const;

    bool operator==(const TxAux&) const = default;
};

} // namespace primitives
