#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Runtime settings of the ledger core and logging initialisation
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace txp {

/// Default cap on pending transactions.
inline constexpr size_t DEFAULT_MAX_MEMPOOL_TXS = 200;

struct TxpSettings {
    /// Workers for signature checks; 0 means one per core.
    int sig_check_threads = 1;

    /// process_tx() rejects new transactions once the pool holds this many.
    size_t max_mempool_txs = DEFAULT_MAX_MEMPOOL_TXS;

    core::LogLevel    log_level = core::LogLevel::INFO;
    core::LogCategory log_categories = core::LogCategory::ALL;

    /// Empty disables the file sink.
    std::string log_file;
    bool print_to_console = true;

    /// Read every setting from @p config, falling back to the defaults
    /// above. Fails with PARSE_BAD_FORMAT on unknown level or category
    /// names and on out-of-range numbers.
    static core::Result<TxpSettings> from_config(const core::Config& config);
};

/// Parse a comma-separated, case-insensitive list of category names into
/// a mask. An empty list yields ALL.
[[nodiscard]] core::Result<core::LogCategory> parse_log_categories(
    std::string_view names);

/// Apply level, categories and sinks from @p settings to the global Logger.
/// Fails with STORAGE_ERROR if the log file cannot be opened.
[[nodiscard]] core::Result<void> init_logging(const TxpSettings& settings);

} // namespace txp
