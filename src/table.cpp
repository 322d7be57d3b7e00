#include <marshal-cpp/table.hpp>
#include <marshal-cpp/error.hpp>

#include "wire/reader.hpp"
#include "wire/writer.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace marshal_cpp {

namespace {

constexpr std::size_t header_size = 16;

auto checked_cell_count(std::uint64_t x, std::uint64_t y, std::uint64_t z) -> std::size_t {
    constexpr auto limit = std::uint64_t{std::numeric_limits<std::uint32_t>::max()};
    if (x > limit || y > limit || z > limit ||
        (y != 0 && x > limit / y) || (z != 0 && x * y > limit / z)) {
        throw Exception{ErrorKind::grid_shape_mismatch,
                        "table dimensions " + std::to_string(x) + "x" + std::to_string(y) +
                        "x" + std::to_string(z) + " overflow the cell count"};
    }
    return static_cast<std::size_t>(x * y * z);
}

}  // anonymous namespace

Table::Table(std::size_t xsize, std::size_t ysize, std::size_t zsize)
    : xsize_{xsize}, ysize_{ysize}, zsize_{zsize},
      data_(checked_cell_count(xsize, ysize, zsize), 0) {}

auto Table::from_data(std::size_t xsize, std::size_t ysize, std::size_t zsize,
                      std::vector<std::uint16_t> data) -> Table {
    auto expected = checked_cell_count(xsize, ysize, zsize);
    if (data.size() != expected) {
        throw Exception{ErrorKind::grid_shape_mismatch,
                        std::to_string(data.size()) + " cells for a " +
                        std::to_string(xsize) + "x" + std::to_string(ysize) + "x" +
                        std::to_string(zsize) + " table"};
    }
    auto table = Table{};
    table.xsize_ = xsize;
    table.ysize_ = ysize;
    table.zsize_ = zsize;
    table.data_ = std::move(data);
    return table;
}

auto Table::at(std::size_t x, std::size_t y, std::size_t z) -> std::uint16_t& {
    if (x >= xsize_ || y >= ysize_ || z >= zsize_) {
        throw std::out_of_range{"table index out of range"};
    }
    return data_[index(x, y, z)];
}

auto Table::at(std::size_t x, std::size_t y, std::size_t z) const -> std::uint16_t {
    if (x >= xsize_ || y >= ysize_ || z >= zsize_) {
        throw std::out_of_range{"table index out of range"};
    }
    return data_[index(x, y, z)];
}

void Table::resize(std::size_t xsize, std::size_t ysize, std::size_t zsize,
                   std::uint16_t fill) {
    auto resized = std::vector<std::uint16_t>(checked_cell_count(xsize, ysize, zsize), fill);
    auto keep_x = std::min(xsize, xsize_);
    auto keep_y = std::min(ysize, ysize_);
    auto keep_z = std::min(zsize, zsize_);
    for (std::size_t z = 0; z < keep_z; ++z) {
        for (std::size_t y = 0; y < keep_y; ++y) {
            for (std::size_t x = 0; x < keep_x; ++x) {
                resized[x + xsize * (y + ysize * z)] = data_[index(x, y, z)];
            }
        }
    }
    xsize_ = xsize;
    ysize_ = ysize;
    zsize_ = zsize;
    data_ = std::move(resized);
}

auto encode_table(const Table& table) -> Bytes {
    auto w = wire::Writer{};
    w.write_u32(static_cast<std::uint32_t>(table.xsize()));
    w.write_u32(static_cast<std::uint32_t>(table.ysize()));
    w.write_u32(static_cast<std::uint32_t>(table.zsize()));
    w.write_u32(static_cast<std::uint32_t>(table.size()));
    for (auto cell : table.data()) {
        w.write_u16(cell);
    }
    return w.take();
}

// The header is four u32 words: xsize, ysize, zsize, count. Tables
// written by RGSS itself carry a fifth leading word holding the number
// of dimensions (20 header bytes); such blobs fail the shape checks
// here with grid_shape_mismatch.
auto decode_table(std::span<const std::byte> bytes) -> Table {
    if (bytes.size() < header_size) {
        throw Exception{ErrorKind::grid_shape_mismatch,
                        "table header needs " + std::to_string(header_size) + " bytes, got " +
                        std::to_string(bytes.size())};
    }

    auto r = wire::Reader{bytes};
    auto xsize = r.read_u32();
    auto ysize = r.read_u32();
    auto zsize = r.read_u32();
    auto count = r.read_u32();

    auto expected = checked_cell_count(xsize, ysize, zsize);
    if (count != expected) {
        throw Exception{ErrorKind::grid_shape_mismatch,
                        "table count " + std::to_string(count) + " does not match " +
                        std::to_string(xsize) + "x" + std::to_string(ysize) + "x" +
                        std::to_string(zsize)};
    }
    if (r.remaining() != std::size_t{count} * 2) {
        throw Exception{ErrorKind::grid_shape_mismatch,
                        "table holds " + std::to_string(r.remaining()) +
                        " cell bytes, expected " + std::to_string(std::size_t{count} * 2)};
    }

    auto cells = std::vector<std::uint16_t>{};
    cells.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        cells.push_back(r.read_u16());
    }
    return Table::from_data(xsize, ysize, zsize, std::move(cells));
}

}  // namespace marshal_cpp
