/// @file codec.hpp
/// @brief Decode and encode Marshal 4.8 byte streams.

#pragma once

#include <marshal-cpp/graph.hpp>

#include <cstddef>
#include <span>
#include <vector>

namespace marshal_cpp {

/// Tuning knobs for decode().
struct DecodeOptions {
    /// Deepest nesting accepted before the input is rejected as malformed.
    std::size_t max_depth{2048};
};

/// Decode one complete Marshal stream.
///
/// The buffer must hold exactly one value after the version header.
/// Throws Exception on any error; no partial document is returned.
///
/// @code
/// auto doc = marshal_cpp::decode(bytes);
/// if (auto* obj = doc.graph.get_if<marshal_cpp::Object>(doc.root)) { ... }
/// @endcode
auto decode(std::span<const std::byte> data, const DecodeOptions& options = {}) -> Document;

/// Encode a value and everything reachable from it.
///
/// Symbols are written once and linked afterwards; a node reachable
/// along several paths is written once and linked by index, which
/// preserves sharing and cycles.
auto encode(const Graph& graph, const Value& root) -> std::vector<std::byte>;

/// Encode a document's root value.
inline auto encode(const Document& doc) -> std::vector<std::byte> {
    return encode(doc.graph, doc.root);
}

}  // namespace marshal_cpp
