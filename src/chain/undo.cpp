// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/undo.h"

#include "core/serialize.h"
#include "core/stream.h"

#include <exception>
#include <string>

namespace chain {

std::vector<uint8_t> TxUndo::serialize() const {
    core::DataStream stream;
    core::ser_write_obj_vector(stream, spent);
    return stream.release();
}

core::Result<TxUndo> TxUndo::deserialize(std::span<const uint8_t> data) {
    core::SpanReader stream(data);
    TxUndo undo;
    try {
        undo.spent = core::ser_read_obj_vector<primitives::TxOutAux>(stream);
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
            std::string("Failed to decode TxUndo: ") + e.what());
    }
    if (!stream.eof()) {
        return core::Error(core::ErrorCode::PARSE_ERROR,
            "TxUndo has " + std::to_string(stream.remaining()) +
            " trailing bytes");
    }
    return undo;
}

} // namespace chain
