#pragma once

#include <cstdint>
#include <string>
#include "../types/result.hpp"
#include "../types/tile_info.hpp"

#ifndef GEOTILE_TILE_GRID_HEADER
#include "../tile_grid.hpp" // for linters
#endif

namespace geotile {

constexpr TileGrid::TileGrid(uint32_t image_width, uint32_t image_height,
                             uint32_t tile_width, uint32_t tile_length) noexcept
    : image_width_(image_width)
    , image_height_(image_height)
    , tile_width_(tile_width)
    , tile_length_(tile_length)
    , tiles_across_(static_cast<uint32_t>((static_cast<uint64_t>(image_width) + tile_width - 1) / tile_width))
    , tiles_down_(static_cast<uint32_t>((static_cast<uint64_t>(image_height) + tile_length - 1) / tile_length)) {}

inline Result<TileGrid> TileGrid::create(uint32_t image_width, uint32_t image_height,
                                         uint32_t tile_width, uint32_t tile_length) noexcept {
    if (tile_width == 0 || tile_length == 0) [[unlikely]] {
        return Err(Error::Code::InvalidFormat,
                   "Tile dimensions must be non-zero, got " + std::to_string(tile_width) + "x" +
                   std::to_string(tile_length));
    }
    if (image_width == 0 || image_height == 0) [[unlikely]] {
        return Err(Error::Code::InvalidFormat,
                   "Image dimensions must be non-zero, got " + std::to_string(image_width) + "x" +
                   std::to_string(image_height));
    }
    return Ok(TileGrid(image_width, image_height, tile_width, tile_length));
}

constexpr uint64_t TileGrid::num_tiles() const noexcept {
    return static_cast<uint64_t>(tiles_across_) * tiles_down_;
}

constexpr uint64_t TileGrid::samples_per_tile() const noexcept {
    return static_cast<uint64_t>(tile_width_) * tile_length_;
}

constexpr bool TileGrid::contains(int64_t x, int64_t y) const noexcept {
    return x >= 0 && y >= 0 && x < static_cast<int64_t>(image_width_) && y < static_cast<int64_t>(image_height_);
}

inline Result<TilePosition> TileGrid::position(int64_t x, int64_t y) const noexcept {
    if (!contains(x, y)) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "Pixel (" + std::to_string(x) + ", " + std::to_string(y) + ") outside raster of " +
                   std::to_string(image_width_) + "x" + std::to_string(image_height_));
    }

    // Both operands are non-negative here, so truncating division is floor division
    const auto ux = static_cast<uint32_t>(x);
    const auto uy = static_cast<uint32_t>(y);

    TilePosition pos;
    pos.tile.x = ux / tile_width_;
    pos.tile.y = uy / tile_length_;
    pos.tile_index = static_cast<uint64_t>(pos.tile.y) * tiles_across_ + pos.tile.x;
    pos.x_in_tile = ux % tile_width_;
    pos.y_in_tile = uy % tile_length_;
    return Ok(pos);
}

inline Result<TileCoordinates> TileGrid::tile_coordinates(uint64_t tile_index) const noexcept {
    if (tile_index >= num_tiles()) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "Tile index " + std::to_string(tile_index) + " outside grid of " +
                   std::to_string(num_tiles()) + " tiles");
    }
    return Ok(TileCoordinates{static_cast<uint32_t>(tile_index % tiles_across_),
                             static_cast<uint32_t>(tile_index / tiles_across_)});
}

} // namespace geotile
