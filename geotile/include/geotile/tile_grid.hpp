#pragma once

#include <cstdint>
#include "types/result.hpp"
#include "types/tile_info.hpp"

namespace geotile {

/// Row-major partition of a raster into equally sized tiles.
/// Edge tiles are stored padded to the full tile size, so every tile holds
/// tile_width * tile_length samples.
class TileGrid {
private:
    uint32_t image_width_{0};
    uint32_t image_height_{0};
    uint32_t tile_width_{0};
    uint32_t tile_length_{0};
    uint32_t tiles_across_{0};
    uint32_t tiles_down_{0};

    constexpr TileGrid(uint32_t image_width, uint32_t image_height,
                       uint32_t tile_width, uint32_t tile_length) noexcept;

public:
    constexpr TileGrid() noexcept = default;

    /// Build a grid. Zero image or tile dimensions are rejected with InvalidFormat.
    [[nodiscard]] static Result<TileGrid> create(uint32_t image_width, uint32_t image_height,
                                                 uint32_t tile_width, uint32_t tile_length) noexcept;

    [[nodiscard]] constexpr uint32_t image_width() const noexcept { return image_width_; }
    [[nodiscard]] constexpr uint32_t image_height() const noexcept { return image_height_; }
    [[nodiscard]] constexpr uint32_t tile_width() const noexcept { return tile_width_; }
    [[nodiscard]] constexpr uint32_t tile_length() const noexcept { return tile_length_; }
    [[nodiscard]] constexpr TileSize tile_size() const noexcept { return TileSize{tile_width_, tile_length_}; }

    /// ceil(image_width / tile_width)
    [[nodiscard]] constexpr uint32_t tiles_across() const noexcept { return tiles_across_; }

    /// ceil(image_height / tile_length)
    [[nodiscard]] constexpr uint32_t tiles_down() const noexcept { return tiles_down_; }

    [[nodiscard]] constexpr uint64_t num_tiles() const noexcept;

    /// Samples per (padded) tile
    [[nodiscard]] constexpr uint64_t samples_per_tile() const noexcept;

    [[nodiscard]] constexpr bool contains(int64_t x, int64_t y) const noexcept;

    /// Decompose a pixel coordinate. Coordinates outside the raster yield OutOfBounds.
    [[nodiscard]] Result<TilePosition> position(int64_t x, int64_t y) const noexcept;

    /// Tile column/row of a tile index. Index beyond the grid yields OutOfBounds.
    [[nodiscard]] Result<TileCoordinates> tile_coordinates(uint64_t tile_index) const noexcept;
};

} // namespace geotile

#define GEOTILE_TILE_GRID_HEADER
#include "impl/tile_grid_impl.hpp"
