// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.h"

#include "crypto/hash.h"

#include <utility>

namespace primitives {

namespace {

core::uint256 compute_txid(const std::vector<TxInput>& vin,
                           const std::vector<TxOutput>& vout) {
    crypto::HashWriter hw;
    core::ser_write_compact_size(hw, vin.size());
    for (const auto& in : vin) {
        in.prevout.serialize(hw);
    }
    core::ser_write_obj_vector(hw, vout);
    return hw.hash();
}

const TxOutDistribution EMPTY_DISTRIBUTION{};

} // namespace

Transaction::Transaction(std::vector<TxInput> vin, std::vector<TxOutput> vout)
    : vin_(std::move(vin)),
      vout_(std::move(vout)),
      txid_(compute_txid(vin_, vout_)) {}

core::uint256 input_sig_hash(const OutPoint& prevout,
                             const std::vector<TxOutput>& outputs) {
    crypto::HashWriter hw;
    prevout.serialize(hw);
    core::ser_write_obj_vector(hw, outputs);
    return hw.hash();
}

core::Result<std::vector<uint8_t>> sign_input(
    const crypto::ECKey& key,
    const OutPoint& prevout,
    const std::vector<TxOutput>& outputs) {
    return key.sign(input_sig_hash(prevout, outputs));
}

const TxOutDistribution& TxAux::distribution(size_t index) const {
    if (index < distributions.size()) return distributions[index];
    return EMPTY_DISTRIBUTION;
}

core::Result<void> TxAux::check_distributions() const {
    if (distributions.empty()) return core::make_ok();
    if (distributions.size() != tx.vout().size()) {
        return core::make_error(
            core::ErrorCode::VALIDATION_ERROR,
            "distribution count " + std::to_string(distributions.size()) +
                " does not match output count " +
                std::to_string(tx.vout().size()));
    }
    for (size_t i = 0; i < distributions.size(); ++i) {
        TXP_TRY_VOID(check_distribution(tx.vout()[i], distributions[i]));
    }
    return core::make_ok();
}

} // namespace primitives
