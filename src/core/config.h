#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration keys understood by the ledger core
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_LOGLEVEL        = "loglevel";
inline constexpr const char* CONF_LOGCATEGORIES   = "logcategories";
inline constexpr const char* CONF_LOGFILE         = "logfile";
inline constexpr const char* CONF_PRINTTOCONSOLE  = "printtoconsole";
inline constexpr const char* CONF_SIGCHECKTHREADS = "sigcheckthreads";
inline constexpr const char* CONF_MAXMEMPOOLTXS   = "maxmempooltxs";

/// Where a value came from. Later sources shadow earlier ones.
enum class ConfigSource : uint8_t {
    DEFAULT      = 0,
    FILE         = 1,
    COMMAND_LINE = 2,
};

// ---------------------------------------------------------------------------
// Config  --  layered key/value settings
//
// A key may carry several values within one layer
// (-logcategories=utxo -logcategories=mempool); get() returns the first
// value of the highest layer holding the key, get_list() every value.
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// -key=value, --key=value, or a bare -flag meaning "1". Anything not
    /// starting with '-' is logged and skipped.
    void parse_args(int argc, char* argv[]);

    /// key=value lines; '#' starts a comment line. Returns false if the
    /// file cannot be opened.
    bool parse_file(const std::filesystem::path& path);

    /// Replace every value of @p key in layer @p source.
    void set(std::string_view key, std::string value,
             ConfigSource source = ConfigSource::DEFAULT);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// @p default_val if absent; PARSE_BAD_FORMAT unless the whole value
    /// is a decimal integer.
    [[nodiscard]] Result<int64_t> get_int(std::string_view key,
                                          int64_t default_val = 0) const;

    /// 1/true/yes/on and 0/false/no/off, any case. Other values yield
    /// @p default_val.
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Every value of @p key, highest layer first.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    /// Highest layer holding @p key.
    [[nodiscard]] std::optional<ConfigSource> source_of(
        std::string_view key) const;

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    static constexpr size_t NUM_SOURCES = 3;
    std::array<ValueMap, NUM_SOURCES> layers_;

    ValueMap& layer(ConfigSource source) {
        return layers_[static_cast<size_t>(source)];
    }
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
