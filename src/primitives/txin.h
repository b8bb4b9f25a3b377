#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <utility>
#include <vector>

#include "core/serialize.h"
#include "primitives/outpoint.h"

namespace primitives {

/// A transaction input: the output being spent plus the DER signature
/// authorising the spend.
struct TxInput {
    OutPoint prevout;
    std::vector<uint8_t> signature;

    TxInput() = default;
    TxInput(OutPoint prevout_in, std::vector<uint8_t> signature_in = {})
        : prevout(std::move(prevout_in)),
          signature(std::move(signature_in)) {}

    bool operator==(const TxInput&) const = default;

    /// Wire format: prevout (36 bytes) | compact_size(sig) | sig
    template<typename Stream>
    void serialize(Stream& s) const {
        prevout.serialize(s);
        core::ser_write_vector(s, signature);
    }

    template<typename Stream>
    static TxInput deserialize(Stream& s) {
        TxInput input;
        input.prevout = OutPoint::deserialize(s);
        input.signature = core::ser_read_vector(s);
        return input;
    }
};

} // namespace primitives
