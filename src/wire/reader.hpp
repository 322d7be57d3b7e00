#pragma once

// Forward-only byte cursor over a borrowed buffer.
// Internal header — not installed.

#include <marshal-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace marshal_cpp::wire {

class Reader {
public:
    explicit Reader(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    // Borrow the next n bytes. The span aliases the input buffer.
    auto read_exact(std::size_t n) -> std::span<const std::byte> {
        if (n > remaining()) {
            throw Exception{ErrorKind::unexpected_end,
                            "need " + std::to_string(n) + " bytes at offset " +
                            std::to_string(pos_) + ", " + std::to_string(remaining()) +
                            " remain"};
        }
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_byte() -> std::byte {
        return read_exact(1)[0];
    }

    auto read_u8() -> std::uint8_t {
        return static_cast<std::uint8_t>(read_byte());
    }

    auto read_u16() -> std::uint16_t {
        auto b = read_exact(2);
        return static_cast<std::uint16_t>(
            static_cast<unsigned>(b[0]) | (static_cast<unsigned>(b[1]) << 8));
    }

    auto read_u32() -> std::uint32_t {
        auto b = read_exact(4);
        auto v = std::uint32_t{0};
        for (std::size_t i = 0; i < 4; ++i) {
            v |= static_cast<std::uint32_t>(b[i]) << (8 * i);
        }
        return v;
    }

    auto read_i32() -> std::int32_t {
        return static_cast<std::int32_t>(read_u32());
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace marshal_cpp::wire
