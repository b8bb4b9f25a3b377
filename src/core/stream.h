#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// SpanReader -- read cursor over bytes owned elsewhere
// ---------------------------------------------------------------------------
class SpanReader {
public:
    SpanReader() = default;
    explicit SpanReader(std::span<const uint8_t> data) : data_(data) {}

    /// Throws std::runtime_error, consuming nothing, if fewer than
    /// out.size() bytes remain.
    void read(std::span<uint8_t> out) {
        if (out.size() > remaining()) {
            throw std::runtime_error(
                "read of " + std::to_string(out.size()) + " bytes with " +
                std::to_string(remaining()) + " left");
        }
        if (!out.empty()) {
            std::memcpy(out.data(), data_.data() + pos_, out.size());
        }
        pos_ += out.size();
    }

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] bool eof() const noexcept { return pos_ >= data_.size(); }

private:
    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

// ---------------------------------------------------------------------------
// DataStream -- growable buffer; writes append, reads consume from the front
// ---------------------------------------------------------------------------
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(std::vector<uint8_t> data) : buf_(std::move(data)) {}

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    void read(std::span<uint8_t> out) {
        SpanReader reader(unread());
        reader.read(out);
        read_pos_ += out.size();
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] size_t remaining() const noexcept { return buf_.size() - read_pos_; }
    [[nodiscard]] bool eof() const noexcept { return read_pos_ >= buf_.size(); }

    /// Everything written, including bytes already read.
    [[nodiscard]] std::span<const uint8_t> span() const noexcept { return buf_; }

    /// Take the buffer, leaving the stream empty.
    [[nodiscard]] std::vector<uint8_t> release() {
        read_pos_ = 0;
        return std::exchange(buf_, {});
    }

private:
    std::span<const uint8_t> unread() const noexcept {
        return std::span<const uint8_t>(buf_).subspan(read_pos_);
    }

    std::vector<uint8_t> buf_;
    size_t               read_pos_ = 0;
};

}  // namespace core
