/// @file table.hpp
/// @brief Dense three-dimensional grid of 16-bit cells and its byte layout.

#pragma once

#include <marshal-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace marshal_cpp {

/// A dense grid of unsigned 16-bit cells (RGSS `Table`).
///
/// Tile layers, passage flags and actor parameter curves are stored this
/// way. Unused dimensions have size 1. The invariant
/// `data().size() == xsize() * ysize() * zsize()` always holds: every
/// constructor and mutator preserves it.
///
/// Cells are laid out with x varying fastest, then y, then z.
class Table {
public:
    /// An empty 0x1x1 grid.
    Table() = default;

    /// A zero-filled grid with the given dimensions.
    explicit Table(std::size_t xsize, std::size_t ysize = 1, std::size_t zsize = 1);

    /// Build a grid around existing cells.
    /// Throws Exception{grid_shape_mismatch} if the cell count is wrong.
    static auto from_data(std::size_t xsize, std::size_t ysize, std::size_t zsize,
                          std::vector<std::uint16_t> data) -> Table;

    auto xsize() const noexcept -> std::size_t { return xsize_; }
    auto ysize() const noexcept -> std::size_t { return ysize_; }
    auto zsize() const noexcept -> std::size_t { return zsize_; }

    /// Total number of cells.
    auto size() const noexcept -> std::size_t { return data_.size(); }
    auto empty() const noexcept -> bool { return data_.empty(); }

    /// Bounds-checked access. Throws std::out_of_range.
    auto at(std::size_t x, std::size_t y = 0, std::size_t z = 0) -> std::uint16_t&;
    auto at(std::size_t x, std::size_t y = 0, std::size_t z = 0) const -> std::uint16_t;

    /// Unchecked access.
    auto operator()(std::size_t x, std::size_t y = 0, std::size_t z = 0) -> std::uint16_t& {
        return data_[index(x, y, z)];
    }
    auto operator()(std::size_t x, std::size_t y = 0, std::size_t z = 0) const -> std::uint16_t {
        return data_[index(x, y, z)];
    }

    /// Change the dimensions. Cells inside both the old and the new
    /// bounds keep their value; new cells are filled with `fill`.
    void resize(std::size_t xsize, std::size_t ysize = 1, std::size_t zsize = 1,
                std::uint16_t fill = 0);

    auto data() const noexcept -> std::span<const std::uint16_t> { return data_; }
    auto data() noexcept -> std::span<std::uint16_t> { return data_; }

    auto operator==(const Table&) const -> bool = default;

private:
    auto index(std::size_t x, std::size_t y, std::size_t z) const noexcept -> std::size_t {
        return x + xsize_ * (y + ysize_ * z);
    }

    std::size_t xsize_{0};
    std::size_t ysize_{1};
    std::size_t zsize_{1};
    std::vector<std::uint16_t> data_;
};

/// Class name under which tables are written as user data.
inline constexpr const char* table_class_name = "Table";

/// Serialize a grid to its opaque byte layout:
/// u32 xsize, u32 ysize, u32 zsize, u32 count, then count u16 cells,
/// all little-endian.
auto encode_table(const Table& table) -> Bytes;

/// Parse the opaque byte layout produced by encode_table().
/// Throws Exception{grid_shape_mismatch} if the header is truncated, the
/// count disagrees with the dimensions, or the cell bytes disagree with
/// the count.
auto decode_table(std::span<const std::byte> bytes) -> Table;

}  // namespace marshal_cpp
