#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace core {

/// Message severity, ordered from most to least verbose. OFF silences
/// everything.
enum class LogLevel : int {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERR,  // printed as "ERROR"
    FATAL,
    OFF,
};

/// Subsystem tags. A message is printed when its tag intersects the
/// logger's enabled mask; NONE is never filtered.
enum class LogCategory : uint32_t {
    NONE       = 0,
    VALIDATION = 1u << 0,
    MEMPOOL    = 1u << 1,
    UTXO       = 1u << 2,
    STAKES     = 1u << 3,
    CRYPTO     = 1u << 4,
    CONFIG     = 1u << 5,
    BENCH      = 1u << 6,
    ALL        = ~0u,
};

constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return LogCategory{static_cast<uint32_t>(a) | static_cast<uint32_t>(b)};
}

constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return LogCategory{static_cast<uint32_t>(a) & static_cast<uint32_t>(b)};
}

constexpr LogCategory& operator|=(LogCategory& a, LogCategory b) noexcept {
    return a = a | b;
}

std::string_view log_level_string(LogLevel level) noexcept;

/// Name of a single category. Masks with several bits report the
/// lowest one.
std::string_view log_category_string(LogCategory cat) noexcept;

/// Case-insensitive; "err" is accepted as well as "error".
std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

/// Case-insensitive; "all" and "none" map to the full and empty masks.
std::optional<LogCategory> log_category_from_string(
    std::string_view name) noexcept;

/// Process-wide logger writing to stderr and, optionally, a file.
///
/// Filtering state is atomic so will_log() never blocks. Lines are
/// serialized under a mutex; WARN and above flush both outputs.
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    LogLevel level() const noexcept;

    void set_categories(LogCategory mask);
    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);
    LogCategory enabled_categories() const noexcept;

    bool will_log(LogLevel level, LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Appends to @p path, closing any previous file. An empty path just
    /// closes. Returns false when the file cannot be opened.
    bool set_log_file(const std::filesystem::path& path);

    void flush();

    void write(LogLevel level, LogCategory cat, std::string_view message);

private:
    Logger() = default;
    ~Logger();

    std::string format_line(LogLevel level, LogCategory cat,
                            std::string_view message) const;

    std::atomic<int> min_level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> category_mask_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool> to_console_{true};
    std::atomic<bool> to_file_{false};

    std::mutex out_mutex_;
    std::ofstream file_;
};

} // namespace core

// The message argument is evaluated only when the line will be printed:
//   LOG_DEBUG(core::LogCategory::MEMPOOL, "dropped " + txid.to_hex());
#define TXP_LOG_AT(lvl, cat, msg)                                        \
    do {                                                                 \
        auto& txp_logger_ = core::Logger::instance();                    \
        if (txp_logger_.will_log((lvl), (cat))) {                        \
            txp_logger_.write((lvl), (cat), std::string(msg));           \
        }                                                                \
    } while (0)

#define LOG_TRACE(cat, msg) TXP_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) TXP_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  TXP_LOG_AT(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  TXP_LOG_AT(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) TXP_LOG_AT(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) TXP_LOG_AT(core::LogLevel::FATAL, cat, msg)
