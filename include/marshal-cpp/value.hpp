/// @file value.hpp
/// @brief Inline value types: Nil, BigInt, Symbol, NodeRef and Value.

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace marshal_cpp {

/// Ruby's nil.
struct Nil {
    auto operator<=>(const Nil&) const = default;
    auto operator==(const Nil&) const -> bool = default;
};

/// A byte array value.
using Bytes = std::vector<std::byte>;

/// An integer that does not fit in int64_t.
///
/// The magnitude is stored little-endian with no trailing zero bytes,
/// so two BigInts holding the same number always compare equal.
struct BigInt {
    bool negative{false};  ///< Sign of the number.
    Bytes magnitude;       ///< Absolute value, little-endian.

    auto operator==(const BigInt&) const -> bool = default;

    /// Build a normalized BigInt from a sign and a raw magnitude.
    static auto from_magnitude(bool negative, Bytes magnitude) -> BigInt {
        while (!magnitude.empty() && magnitude.back() == std::byte{0}) {
            magnitude.pop_back();
        }
        return BigInt{.negative = negative && !magnitude.empty(),
                      .magnitude = std::move(magnitude)};
    }

    /// The value as int64_t, or nullopt if it does not fit.
    auto to_int64() const -> std::optional<std::int64_t> {
        if (magnitude.size() > 8) return std::nullopt;
        auto abs = std::uint64_t{0};
        for (std::size_t i = 0; i < magnitude.size(); ++i) {
            abs |= static_cast<std::uint64_t>(magnitude[i]) << (8 * i);
        }
        if (!negative) {
            if (abs > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
            return static_cast<std::int64_t>(abs);
        }
        if (abs > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1) return std::nullopt;
        return static_cast<std::int64_t>(0 - abs);
    }

    /// Convert an int64_t to sign + magnitude form.
    static auto from_int64(std::int64_t v) -> BigInt {
        auto abs = v < 0 ? 0 - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v);
        auto mag = Bytes{};
        while (abs != 0) {
            mag.push_back(static_cast<std::byte>(abs & 0xFF));
            abs >>= 8;
        }
        return BigInt{.negative = v < 0, .magnitude = std::move(mag)};
    }
};

/// An interned symbol such as `:name` or `:@volume`.
struct Symbol {
    std::string name;

    auto operator<=>(const Symbol&) const = default;
    auto operator==(const Symbol&) const -> bool = default;
};

/// Index of a heap node inside a Graph.
///
/// Two values holding the same NodeRef refer to the same instance.
struct NodeRef {
    std::uint32_t index{0};

    auto operator<=>(const NodeRef&) const = default;
    auto operator==(const NodeRef&) const -> bool = default;
};

/// A value in the object graph.
///
/// Immediates and immutable numbers are stored inline; everything Ruby
/// treats as a mutable heap object lives in the Graph and is referenced
/// through a NodeRef.
using Value = std::variant<
    Nil,
    bool,
    std::int64_t,
    BigInt,
    double,
    Symbol,
    NodeRef
>;

/// Check if a Value is nil.
inline auto is_nil(const Value& v) -> bool {
    return std::holds_alternative<Nil>(v);
}

/// Name of the alternative held by a Value, for diagnostics.
inline auto type_name(const Value& v) noexcept -> std::string_view {
    switch (v.index()) {
        case 0: return "nil";
        case 1: return "bool";
        case 2: return "integer";
        case 3: return "bignum";
        case 4: return "float";
        case 5: return "symbol";
        case 6: return "object";
    }
    return "unknown";
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](std::int64_t i) { ... },
///     [](const Symbol& s) { ... },
///     [](auto&&) { ... },
/// }, value);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Extract a typed inline value, or nullopt on type mismatch.
template <typename T>
auto get_as(const Value& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v)) {
        return *t;
    }
    return std::nullopt;
}

}  // namespace marshal_cpp
