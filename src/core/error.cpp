// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <array>

namespace core {

namespace {

struct CodeName {
    ErrorCode        code;
    std::string_view name;
};

constexpr std::array<CodeName, 18> CODE_NAMES = {{
    {ErrorCode::NONE,                 "NONE"},
    {ErrorCode::PARSE_ERROR,          "PARSE_ERROR"},
    {ErrorCode::PARSE_BAD_FORMAT,     "PARSE_BAD_FORMAT"},
    {ErrorCode::VALIDATION_ERROR,     "VALIDATION_ERROR"},
    {ErrorCode::VALIDATION_RANGE,     "VALIDATION_RANGE"},
    {ErrorCode::VALIDATION_INPUT,     "VALIDATION_INPUT"},
    {ErrorCode::VALIDATION_DUPLICATE, "VALIDATION_DUPLICATE"},
    {ErrorCode::VALIDATION_UNDERFLOW, "VALIDATION_UNDERFLOW"},
    {ErrorCode::VALIDATION_CYCLE,     "VALIDATION_CYCLE"},
    {ErrorCode::VALIDATION_REJECTED,  "VALIDATION_REJECTED"},
    {ErrorCode::VALIDATION_KNOWN,     "VALIDATION_KNOWN"},
    {ErrorCode::VALIDATION_POOL_FULL, "VALIDATION_POOL_FULL"},
    {ErrorCode::CRYPTO_SIG_FAIL,      "CRYPTO_SIG_FAIL"},
    {ErrorCode::CRYPTO_KEY_FAIL,      "CRYPTO_KEY_FAIL"},
    {ErrorCode::STORAGE_ERROR,        "STORAGE_ERROR"},
    {ErrorCode::STORAGE_NOT_FOUND,    "STORAGE_NOT_FOUND"},
    {ErrorCode::STORAGE_CORRUPT,      "STORAGE_CORRUPT"},
    {ErrorCode::INTERNAL_ERROR,       "INTERNAL_ERROR"},
}};

std::string_view base_name(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // anonymous namespace

std::string_view error_code_name(ErrorCode code) noexcept {
    for (const auto& entry : CODE_NAMES) {
        if (entry.code == code) return entry.name;
    }
    return "UNKNOWN";
}

std::string Error::format() const {
    std::string out(error_code_name(code_));
    if (!message_.empty()) {
        out.append(": ").append(message_);
    }
    std::string_view file = location_.file_name();
    if (!file.empty()) {
        out.append(" (").append(base_name(file)).append(":")
           .append(std::to_string(location_.line())).append(")");
    }
    return out;
}

namespace detail {

void throw_bad_result_access(const char* what) {
    throw std::logic_error(what);
}

} // namespace detail

} // namespace core
