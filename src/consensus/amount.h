#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Wide coin arithmetic for verification
// ---------------------------------------------------------------------------
// Input and output totals are summed in 128 bits so that no combination of
// valid coins can overflow. The sums never become Coin values themselves.
// ---------------------------------------------------------------------------

#include "primitives/coin.h"
#include "primitives/txout.h"

#include <string>
#include <vector>

namespace consensus {

__extension__ typedef unsigned __int128 WideCoin;

/// Sum of every coin in @p coins.
[[nodiscard]] WideCoin sum_coins(const std::vector<primitives::Coin>& coins);

/// Sum of the coins carried by @p outputs.
[[nodiscard]] WideCoin sum_outputs(
    const std::vector<primitives::TxOutput>& outputs);

/// Decimal rendering, for log and error messages.
[[nodiscard]] std::string wide_to_string(WideCoin value);

} // namespace consensus
