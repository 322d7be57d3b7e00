#pragma once

// Append-only byte sink for the Marshal binary format.
// Internal header — not installed.

#include "fixnum.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace marshal_cpp::wire {

class Writer {
public:
    void write_byte(std::byte b) {
        data_.push_back(b);
    }

    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_u16(std::uint16_t v) {
        write_u8(static_cast<std::uint8_t>(v & 0xFF));
        write_u8(static_cast<std::uint8_t>(v >> 8));
    }

    void write_u32(std::uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            write_u8(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_fixnum(std::int64_t value) {
        encode_fixnum(value, data_);
    }

    void write_text(std::string_view s) {
        for (auto c : s) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    auto size() const -> std::size_t { return data_.size(); }
    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace marshal_cpp::wire
