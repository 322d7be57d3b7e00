#pragma once

// zlib streams for script bodies.
//
// RGSS stores each script as a complete zlib stream (2-byte header,
// deflate data, Adler-32 trailer), the format Zlib::Deflate.deflate
// writes. Both directions run through a scoped z_stream.
//
// Internal header — not installed.

#include <array>
#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace marshal_cpp::detail {

enum class ZDirection { deflate, inflate };

// Owns one initialized z_stream and ends it on scope exit.
template <ZDirection Direction>
class ZStream {
public:
    ZStream() {
        if constexpr (Direction == ZDirection::deflate) {
            ok_ = ::deflateInit(&stream_, Z_DEFAULT_COMPRESSION) == Z_OK;
        } else {
            ok_ = ::inflateInit(&stream_) == Z_OK;
        }
    }

    ~ZStream() {
        if (!ok_) return;
        if constexpr (Direction == ZDirection::deflate) {
            ::deflateEnd(&stream_);
        } else {
            ::inflateEnd(&stream_);
        }
    }

    ZStream(const ZStream&) = delete;
    auto operator=(const ZStream&) -> ZStream& = delete;

    auto ok() const noexcept -> bool { return ok_; }
    auto get() noexcept -> z_stream* { return &stream_; }

private:
    z_stream stream_{};
    bool ok_{false};
};

inline void set_input(z_stream& stream, std::span<const std::byte> input) {
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
}

// Compress into a zlib stream. nullopt if zlib fails.
inline auto zlib_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    if (input.size() > std::numeric_limits<uInt>::max()) return std::nullopt;

    auto z = ZStream<ZDirection::deflate>{};
    if (!z.ok()) return std::nullopt;

    auto output = std::vector<std::byte>(::deflateBound(z.get(), static_cast<uLong>(input.size())));
    set_input(*z.get(), input);
    z.get()->next_out = reinterpret_cast<Bytef*>(output.data());
    z.get()->avail_out = static_cast<uInt>(output.size());

    if (::deflate(z.get(), Z_FINISH) != Z_STREAM_END) return std::nullopt;
    output.resize(z.get()->total_out);
    return output;
}

// Inflate a zlib stream, giving up once the output would pass `limit`
// bytes. An empty input inflates to nothing. nullopt on corrupt,
// truncated or oversized data.
inline auto zlib_decompress(std::span<const std::byte> input, std::size_t limit)
    -> std::optional<std::vector<std::byte>> {
    if (input.empty()) return std::vector<std::byte>{};
    if (input.size() > std::numeric_limits<uInt>::max()) return std::nullopt;

    auto z = ZStream<ZDirection::inflate>{};
    if (!z.ok()) return std::nullopt;
    set_input(*z.get(), input);

    auto output = std::vector<std::byte>{};
    auto chunk = std::array<std::byte, 16384>{};
    for (;;) {
        z.get()->next_out = reinterpret_cast<Bytef*>(chunk.data());
        z.get()->avail_out = static_cast<uInt>(chunk.size());

        auto ret = ::inflate(z.get(), Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) return std::nullopt;

        auto produced = chunk.size() - z.get()->avail_out;
        if (output.size() + produced > limit) return std::nullopt;
        output.insert(output.end(), chunk.begin(), chunk.begin() + produced);

        if (ret == Z_STREAM_END) return output;
        // No progress with input exhausted: the stream is truncated.
        if (produced == 0 && z.get()->avail_in == 0) return std::nullopt;
    }
}

}  // namespace marshal_cpp::detail
