/// @file batch.hpp
/// @brief Parallel decode of many independent Marshal streams.

#pragma once

#include <marshal-cpp/codec.hpp>
#include <marshal-cpp/error.hpp>
#include <marshal-cpp/graph.hpp>

#include <cstddef>
#include <span>
#include <variant>
#include <vector>

namespace marshal_cpp {

/// The outcome of decoding one buffer of a batch.
struct BatchResult {
    std::variant<Document, Error> outcome;

    auto ok() const noexcept -> bool { return std::holds_alternative<Document>(outcome); }

    /// The decoded document. Throws std::bad_variant_access on failure.
    auto document() -> Document& { return std::get<Document>(outcome); }
    auto document() const -> const Document& { return std::get<Document>(outcome); }

    /// The error that stopped the decode. Throws std::bad_variant_access on success.
    auto error() const -> const Error& { return std::get<Error>(outcome); }
};

/// Decode every buffer on the shared worker pool.
///
/// Each buffer is decoded independently with its own cursor and
/// reference tables. A failing buffer does not affect the others: its
/// slot holds the Error instead of a Document. Results are in input
/// order.
///
/// @code
/// auto results = marshal_cpp::decode_batch(files);
/// for (auto& r : results) {
///     if (!r.ok()) std::cerr << r.error().message << '\n';
/// }
/// @endcode
auto decode_batch(std::span<const std::vector<std::byte>> inputs,
                  const DecodeOptions& options = {}) -> std::vector<BatchResult>;

}  // namespace marshal_cpp
