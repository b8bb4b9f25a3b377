#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

/// Lowercase hex of @p data, first byte first.
std::string to_hex(std::span<const uint8_t> data);

/// Lowercase hex of @p data, last byte first. Hashes and stakeholder ids
/// are displayed this way.
std::string to_hex_reversed(std::span<const uint8_t> data);

/// Accepts either case. nullopt on odd length or a non-hex character.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

bool is_hex(std::string_view str);

}  // namespace core
