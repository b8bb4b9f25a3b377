// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "txp/settings.h"

#include <cctype>
#include <cstdint>
#include <limits>

namespace txp {

namespace {

std::string_view trim_ws(std::string_view sv) {
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// parse_log_categories
// ---------------------------------------------------------------------------

core::Result<core::LogCategory> parse_log_categories(std::string_view names) {
    core::LogCategory mask = core::LogCategory::NONE;
    bool any = false;

    while (!names.empty()) {
        size_t comma = names.find(',');
        std::string_view item = trim_ws(names.substr(0, comma));
        names = (comma == std::string_view::npos)
                    ? std::string_view{}
                    : names.substr(comma + 1);
        if (item.empty()) continue;

        auto cat = core::log_category_from_string(item);
        if (!cat) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                "Unknown log category: " + std::string(item));
        }
        mask |= *cat;
        any = true;
    }

    return any ? mask : core::LogCategory::ALL;
}

// ---------------------------------------------------------------------------
// TxpSettings::from_config
// ---------------------------------------------------------------------------

core::Result<TxpSettings> TxpSettings::from_config(const core::Config& config) {
    TxpSettings s;

    if (auto level = config.get(core::CONF_LOGLEVEL)) {
        auto parsed = core::log_level_from_string(trim_ws(*level));
        if (!parsed) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               "Unknown log level: " + *level);
        }
        s.log_level = *parsed;
    }

    // -logcategories may repeat, and each value may itself be a list.
    std::string joined;
    for (const auto& value : config.get_list(core::CONF_LOGCATEGORIES)) {
        if (!joined.empty()) joined += ',';
        joined += value;
    }
    s.log_categories = TXP_TRY(parse_log_categories(joined));

    s.log_file = config.get_or(core::CONF_LOGFILE, "");
    s.print_to_console = config.get_bool(core::CONF_PRINTTOCONSOLE, true);

    int64_t threads = TXP_TRY(config.get_int(core::CONF_SIGCHECKTHREADS,
                                             s.sig_check_threads));
    if (threads < 0 || threads > std::numeric_limits<int>::max()) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
            "sigcheckthreads out of range: " + std::to_string(threads));
    }
    s.sig_check_threads = static_cast<int>(threads);

    int64_t max_txs = TXP_TRY(config.get_int(
        core::CONF_MAXMEMPOOLTXS, static_cast<int64_t>(s.max_mempool_txs)));
    if (max_txs < 1) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
            "maxmempooltxs must be positive: " + std::to_string(max_txs));
    }
    s.max_mempool_txs = static_cast<size_t>(max_txs);

    return s;
}

// ---------------------------------------------------------------------------
// init_logging
// ---------------------------------------------------------------------------

core::Result<void> init_logging(const TxpSettings& settings) {
    auto& logger = core::Logger::instance();

    logger.set_level(settings.log_level);
    logger.set_categories(settings.log_categories);
    logger.set_print_to_console(settings.print_to_console);

    if (settings.log_file.empty()) {
        logger.set_print_to_file(false);
        logger.set_log_file({});
    } else {
        if (!logger.set_log_file(settings.log_file)) {
            return core::Error(core::ErrorCode::STORAGE_ERROR,
                               "Cannot open log file: " + settings.log_file);
        }
        logger.set_print_to_file(true);
    }

    LOG_INFO(core::LogCategory::CONFIG,
             "Logging at " +
             std::string(core::log_level_string(settings.log_level)) +
             ", sigcheckthreads=" +
             std::to_string(settings.sig_check_threads) +
             ", maxmempooltxs=" + std::to_string(settings.max_mempool_txs));
    return core::make_ok();
}

} // namespace txp
