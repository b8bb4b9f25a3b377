#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Signature verification tasks for parallel input checking
// ---------------------------------------------------------------------------
// SigCheck captures what is needed to verify the signature of one input and
// is callable as a functor. check_signatures() runs a batch of them, spread
// over worker threads when more than one is allowed.
// ---------------------------------------------------------------------------

#include "primitives/address.h"
#include "primitives/transaction.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace consensus {

struct SigCheck {
    /// Transaction being verified. Must outlive the check.
    const primitives::Transaction* tx = nullptr;

    /// Index into tx->vin().
    size_t input_index = 0;

    /// Address of the output spent by that input.
    primitives::Address address;

    /// True if the input's signature is valid under @c address over
    /// input_sig_hash(prevout, tx->vout()).
    bool operator()() const;
};

/// Run every check and return one entry per check (1 = valid).
///
/// @p num_threads <= 0 uses one worker per core. With one worker, or fewer
/// than two checks, everything runs on the calling thread.
[[nodiscard]] std::vector<uint8_t> check_signatures(
    const std::vector<SigCheck>& checks, int num_threads);

} // namespace consensus
