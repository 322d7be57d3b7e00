#pragma once

// Marshal "long" variable-length integer encoding.
// Used for fixnum values and for every count, length and table index.
//
// Leading byte c (signed):
//   0            -> 0
//   5..127       -> c - 5
//   -128..-5     -> c + 5
//   1..4         -> c little-endian bytes follow, zero-extended
//   -4..-1       -> -c little-endian bytes follow, one-extended
//
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace marshal_cpp::wire {

// Range of Integer values written with the 'i' tag. Values outside it
// are written as bignums, as a 32-bit producer would.
inline constexpr std::int64_t fixnum_min = -(std::int64_t{1} << 30);
inline constexpr std::int64_t fixnum_max = (std::int64_t{1} << 30) - 1;

// Largest payload a fixnum may carry.
inline constexpr std::size_t fixnum_max_payload = 4;

// Encode a value in [-2^31, 2^31), appending bytes to output.
inline void encode_fixnum(std::int64_t value, std::vector<std::byte>& output) {
    if (value == 0) {
        output.push_back(std::byte{0});
        return;
    }
    if (value > 0 && value < 123) {
        output.push_back(static_cast<std::byte>(value + 5));
        return;
    }
    if (value < 0 && value > -124) {
        output.push_back(static_cast<std::byte>((value - 5) & 0xFF));
        return;
    }

    auto payload = std::vector<std::byte>{};
    auto x = value;
    for (int i = 1; i <= static_cast<int>(fixnum_max_payload); ++i) {
        payload.push_back(static_cast<std::byte>(x & 0xFF));
        x >>= 8;  // arithmetic shift preserves sign
        if (x == 0) {
            output.push_back(static_cast<std::byte>(i));
            break;
        }
        if (x == -1) {
            output.push_back(static_cast<std::byte>(-i & 0xFF));
            break;
        }
    }
    output.insert(output.end(), payload.begin(), payload.end());
}

// Encode a value, returning the bytes.
inline auto encode_fixnum(std::int64_t value) -> std::vector<std::byte> {
    auto result = std::vector<std::byte>{};
    encode_fixnum(value, result);
    return result;
}

// Number of payload bytes following a leading byte (0 to 4).
inline auto fixnum_payload_size(std::byte lead) -> std::size_t {
    auto c = static_cast<std::int8_t>(lead);
    if (c == 0 || c > 4 || c < -4) return 0;
    return static_cast<std::size_t>(c > 0 ? c : -c);
}

// Decode a fixnum given its leading byte and exactly the payload
// announced by fixnum_payload_size().
inline auto decode_fixnum_payload(std::byte lead, std::span<const std::byte> payload)
    -> std::int64_t {
    auto c = static_cast<std::int8_t>(lead);
    if (c == 0) return 0;
    if (c > 4) return c - 5;
    if (c < -4) return c + 5;

    if (c > 0) {
        auto x = std::int64_t{0};
        for (std::size_t i = 0; i < payload.size(); ++i) {
            x |= static_cast<std::int64_t>(payload[i]) << (8 * i);
        }
        return x;
    }

    auto x = std::int64_t{-1};
    for (std::size_t i = 0; i < payload.size(); ++i) {
        x &= ~(std::int64_t{0xFF} << (8 * i));
        x |= static_cast<std::int64_t>(payload[i]) << (8 * i);
    }
    return x;
}

// Result of a decode operation: decoded value + number of bytes consumed.
struct FixnumDecodeResult {
    std::int64_t value;
    std::size_t bytes_read;
};

// Decode a fixnum from the front of a byte span.
// Returns nullopt if the input is truncated.
inline auto decode_fixnum(std::span<const std::byte> input)
    -> std::optional<FixnumDecodeResult> {
    if (input.empty()) return std::nullopt;
    auto n = fixnum_payload_size(input[0]);
    if (input.size() < 1 + n) return std::nullopt;
    return FixnumDecodeResult{
        .value = decode_fixnum_payload(input[0], input.subspan(1, n)),
        .bytes_read = 1 + n,
    };
}

}  // namespace marshal_cpp::wire
