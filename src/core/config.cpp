// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/logging.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <string>

namespace core {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

std::string lower(std::string_view sv) {
    std::string out(sv);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

/// Split "key=value" (or a bare "key") and store it in @p target.
void store_pair(std::unordered_map<std::string, std::vector<std::string>>& target,
                std::string_view text) {
    auto eq = text.find('=');
    std::string_view key = trim(text.substr(0, eq));
    std::string value = eq == std::string_view::npos
                            ? std::string("1")
                            : std::string(trim(text.substr(eq + 1)));
    target[std::string(key)].push_back(std::move(value));
}

} // anonymous namespace


const std::vector<std::string>* Config::lookup(std::string_view key) const {
    std::string k{key};
    for (size_t i = NUM_SOURCES; i > 0; --i) {
        const auto& values = layers_[i - 1];
        if (auto it = values.find(k); it != values.end() && !it->second.empty()) {
            return &it->second;
        }
    }
    return nullptr;
}

void Config::parse_args(int argc, char* argv[]) {
    auto& target = layer(ConfigSource::COMMAND_LINE);
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (!arg.starts_with("-")) {
            if (!arg.empty()) {
                LOG_WARN(core::LogCategory::CONFIG,
                         "Ignoring positional argument '" +
                         std::string{arg} + "'");
            }
            continue;
        }
        arg.remove_prefix(arg.starts_with("--") ? 2 : 1);
        if (trim(arg.substr(0, arg.find('='))).empty()) {
            LOG_WARN(core::LogCategory::CONFIG,
                     "Ignoring argument without a name: '" +
                     std::string{argv[i]} + "'");
            continue;
        }
        store_pair(target, arg);
    }
}

bool Config::parse_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_ERROR(core::LogCategory::CONFIG,
                  "Cannot open config file '" + path.string() + "'");
        return false;
    }

    auto& target = layer(ConfigSource::FILE);
    std::string line;
    int line_num = 0;
    while (std::getline(in, line)) {
        ++line_num;
        std::string_view sv = trim(line);
        if (sv.empty() || sv.front() == '#') continue;

        if (trim(sv.substr(0, sv.find('='))).empty()) {
            LOG_WARN(core::LogCategory::CONFIG,
                     path.string() + ":" + std::to_string(line_num) +
                     ": missing key");
            continue;
        }
        store_pair(target, sv);
    }

    LOG_DEBUG(core::LogCategory::CONFIG,
              "Read " + std::to_string(line_num) + " lines from '" +
              path.string() + "'");
    return true;
}

void Config::set(std::string_view key, std::string value,
                 ConfigSource source) {
    layer(source)[std::string(key)] = {std::move(value)};
}

std::optional<std::string> Config::get(std::string_view key) const {
    const auto* values = lookup(key);
    if (!values) return std::nullopt;
    return values->front();
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    return get(key).value_or(std::string(default_val));
}

Result<int64_t> Config::get_int(std::string_view key,
                                int64_t default_val) const {
    auto text = get(key);
    if (!text) return default_val;

    int64_t value = 0;
    const char* end = text->data() + text->size();
    auto [ptr, ec] = std::from_chars(text->data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return Error(ErrorCode::PARSE_BAD_FORMAT,
                     "-" + std::string(key) + "=" + *text +
                     " is not an integer");
    }
    return value;
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    auto text = get(key);
    if (!text) return default_val;

    std::string v = lower(*text);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return default_val;
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    std::string k{key};
    std::vector<std::string> result;
    for (size_t i = NUM_SOURCES; i > 0; --i) {
        const auto& values = layers_[i - 1];
        if (auto it = values.find(k); it != values.end()) {
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
    }
    return result;
}

bool Config::has(std::string_view key) const {
    return lookup(key) != nullptr;
}

std::optional<ConfigSource> Config::source_of(std::string_view key) const {
    std::string k{key};
    for (size_t i = NUM_SOURCES; i > 0; --i) {
        if (layers_[i - 1].contains(k)) {
            return static_cast<ConfigSource>(i - 1);
        }
    }
    return std::nullopt;
}

} // namespace core
