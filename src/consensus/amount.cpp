// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/amount.h"

#include <algorithm>

namespace consensus {

WideCoin sum_coins(const std::vector<primitives::Coin>& coins) {
    WideCoin total = 0;
    for (const auto& c : coins) {
        total += c.value();
    }
    return total;
}

WideCoin sum_outputs(const std::vector<primitives::TxOutput>& outputs) {
    WideCoin total = 0;
    for (const auto& out : outputs) {
        total += out.coin.value();
    }
    return total;
}

std::string wide_to_string(WideCoin value) {
    if (value == 0) return "0";
    std::string digits;
    while (value > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace consensus
