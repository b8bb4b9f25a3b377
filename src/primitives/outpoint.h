#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <functional>
#include <string>

#include "core/serialize.h"
#include "core/types.h"

namespace primitives {

/// Reference to one output of an earlier transaction: the key of the
/// unspent-output set.
struct OutPoint {
    /// Id of the referenced transaction.
    core::uint256 txid;

    /// Zero-based index into the referenced transaction's outputs.
    uint32_t n = 0;

    OutPoint() = default;
    OutPoint(const core::uint256& txid_in, uint32_t n_in)
        : txid(txid_in), n(n_in) {}

    bool operator==(const OutPoint&) const = default;
    auto operator<=>(const OutPoint&) const = default;

    /// "<txid_hex>:<index>"
    [[nodiscard]] std::string to_string() const;

    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_blob(s, txid);
        core::ser_write_u32(s, n);
    }

    template<typename Stream>
    static OutPoint deserialize(Stream& s) {
        OutPoint op;
        op.txid = core::ser_read_blob<core::uint256>(s);
        op.n = core::ser_read_u32(s);
        return op;
    }
};

} // namespace primitives

template<>
struct std::hash<primitives::OutPoint> {
    std::size_t operator()(const primitives::OutPoint& op) const noexcept {
        std::size_t h = std::hash<core::uint256>{}(op.txid);
        h ^= static_cast<std::size_t>(op.n);
        h *= 1099511628211ULL;
        return h;
    }
};
