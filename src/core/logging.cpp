// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"
#include "core/thread.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace core {

namespace {

template <typename T>
struct Named {
    T value;
    std::string_view name;
};

constexpr std::array<Named<LogLevel>, 7> LEVELS{{
    {LogLevel::TRACE, "TRACE"},
    {LogLevel::DEBUG, "DEBUG"},
    {LogLevel::INFO, "INFO"},
    {LogLevel::WARN, "WARN"},
    {LogLevel::ERR, "ERROR"},
    {LogLevel::FATAL, "FATAL"},
    {LogLevel::OFF, "OFF"},
}};

constexpr std::array<Named<LogCategory>, 9> CATEGORIES{{
    {LogCategory::NONE, "NONE"},
    {LogCategory::ALL, "ALL"},
    {LogCategory::VALIDATION, "VALIDATION"},
    {LogCategory::MEMPOOL, "MEMPOOL"},
    {LogCategory::UTXO, "UTXO"},
    {LogCategory::STAKES, "STAKES"},
    {LogCategory::CRYPTO, "CRYPTO"},
    {LogCategory::CONFIG, "CONFIG"},
    {LogCategory::BENCH, "BENCH"},
}};

char fold(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool same_name(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](char x, char y) { return fold(x) == fold(y); });
}

template <typename T, size_t N>
std::optional<T> lookup(const std::array<Named<T>, N>& table,
                        std::string_view name) noexcept {
    for (const auto& entry : table) {
        if (same_name(entry.name, name)) return entry.value;
    }
    return std::nullopt;
}

// "2026-02-03T12:00:00.123Z"
std::string utc_timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t secs = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[40];
    int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                          tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                          tm.tm_hour, tm.tm_min, tm.tm_sec,
                          static_cast<int>(ms));
    return n > 0 ? std::string(buf, static_cast<size_t>(n)) : std::string{};
}

} // namespace

std::string_view log_level_string(LogLevel level) noexcept {
    for (const auto& entry : LEVELS) {
        if (entry.value == level) return entry.name;
    }
    return "UNKNOWN";
}

std::string_view log_category_string(LogCategory cat) noexcept {
    auto bits = static_cast<uint32_t>(cat);
    if (bits != 0 && bits != static_cast<uint32_t>(LogCategory::ALL)) {
        bits &= ~bits + 1u;
    }
    for (const auto& entry : CATEGORIES) {
        if (static_cast<uint32_t>(entry.value) == bits) return entry.name;
    }
    return "UNKNOWN";
}

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    if (same_name(name, "err")) return LogLevel::ERR;
    return lookup(LEVELS, name);
}

std::optional<LogCategory> log_category_from_string(
    std::string_view name) noexcept {
    return lookup(CATEGORIES, name);
}

// ---------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel level) {
    min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
}

void Logger::set_categories(LogCategory mask) {
    category_mask_.store(static_cast<uint32_t>(mask), std::memory_order_relaxed);
}

void Logger::enable_category(LogCategory cat) {
    category_mask_.fetch_or(static_cast<uint32_t>(cat),
                            std::memory_order_relaxed);
}

void Logger::disable_category(LogCategory cat) {
    category_mask_.fetch_and(~static_cast<uint32_t>(cat),
                             std::memory_order_relaxed);
}

LogCategory Logger::enabled_categories() const noexcept {
    return static_cast<LogCategory>(
        category_mask_.load(std::memory_order_relaxed));
}

bool Logger::will_log(LogLevel level, LogCategory cat) const noexcept {
    if (static_cast<int>(level) < min_level_.load(std::memory_order_relaxed)) {
        return false;
    }
    if (cat != LogCategory::NONE && (enabled_categories() & cat) == LogCategory::NONE) {
        return false;
    }
    return to_console_.load(std::memory_order_relaxed) ||
           to_file_.load(std::memory_order_relaxed);
}

void Logger::set_print_to_console(bool enable) {
    to_console_.store(enable, std::memory_order_relaxed);
}

void Logger::set_print_to_file(bool enable) {
    to_file_.store(enable, std::memory_order_relaxed);
}

bool Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (file_.is_open()) file_.close();
    if (path.empty()) return true;

    file_.open(path, std::ios::out | std::ios::app);
    if (!file_) {
        to_file_.store(false, std::memory_order_relaxed);
        return false;
    }
    return true;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(out_mutex_);
    if (file_.is_open()) file_.flush();
    std::cerr.flush();
}

std::string Logger::format_line(LogLevel level, LogCategory cat,
                                std::string_view message) const {
    std::string line = utc_timestamp();
    line += " [";
    line += log_level_string(level);
    line += "] [";
    line += log_category_string(cat);
    line += "] ";
    if (auto thread = current_thread_name(); !thread.empty()) {
        line += '(';
        line += thread;
        line += ") ";
    }
    line += message;
    line += '\n';
    return line;
}

void Logger::write(LogLevel level, LogCategory cat, std::string_view message) {
    std::string line = format_line(level, cat, message);
    bool urgent = level >= LogLevel::WARN;

    std::lock_guard<std::mutex> lock(out_mutex_);
    if (to_console_.load(std::memory_order_relaxed)) {
        std::cerr << line;
        if (urgent) std::cerr.flush();
    }
    if (to_file_.load(std::memory_order_relaxed) && file_.is_open()) {
        file_ << line;
        if (urgent) file_.flush();
    }
}

} // namespace core
