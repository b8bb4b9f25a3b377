// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/config.h"
#include "txp/settings.h"

#include <iostream>

// Accepts the usual -loglevel=, -logcategories= and -logfile= options,
// plus -suite=<prefix> to run only matching suites. Logging is off unless
// a level is given.
int main(int argc, char* argv[]) {
    core::Config config;
    config.parse_args(argc, argv);
    if (!config.has(core::CONF_LOGLEVEL)) {
        config.set(core::CONF_LOGLEVEL, "off");
    }

    auto settings = txp::TxpSettings::from_config(config);
    if (!settings) {
        std::cerr << "Invalid options: " << settings.error().format()
                  << std::endl;
        return 1;
    }
    auto logging = txp::init_logging(settings.value());
    if (!logging) {
        std::cerr << "Cannot start logging: " << logging.error().format()
                  << std::endl;
        return 1;
    }

    std::cout << "TXP Unit Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    return test::run_all_tests(config.get_or("suite", ""));
}
